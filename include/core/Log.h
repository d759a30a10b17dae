#pragma once

#include "core/Core.h"
#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace SoftRaster
{

    class SR_API Log
    {
    public:
        static void Init();

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_CoreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetClientLogger() { return s_ClientLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
        static std::shared_ptr<spdlog::logger> s_ClientLogger;
    };

} // namespace SoftRaster

#define SR_CORE_TRACE( ... )    ::SoftRaster::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define SR_CORE_INFO( ... )     ::SoftRaster::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define SR_CORE_WARN( ... )     ::SoftRaster::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define SR_CORE_ERROR( ... )    ::SoftRaster::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define SR_CORE_CRITICAL( ... ) ::SoftRaster::Log::GetCoreLogger()->critical( __VA_ARGS__ )

// Automatically detect if we are inside the library or a client (app, tests)
#ifdef SR_BUILD_LIB
#    define SR_TRACE( ... )    ::SoftRaster::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#    define SR_INFO( ... )     ::SoftRaster::Log::GetCoreLogger()->info( __VA_ARGS__ )
#    define SR_WARN( ... )     ::SoftRaster::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#    define SR_ERROR( ... )    ::SoftRaster::Log::GetCoreLogger()->error( __VA_ARGS__ )
#    define SR_CRITICAL( ... ) ::SoftRaster::Log::GetCoreLogger()->critical( __VA_ARGS__ )
#else
#    define SR_TRACE( ... )    ::SoftRaster::Log::GetClientLogger()->trace( __VA_ARGS__ )
#    define SR_INFO( ... )     ::SoftRaster::Log::GetClientLogger()->info( __VA_ARGS__ )
#    define SR_WARN( ... )     ::SoftRaster::Log::GetClientLogger()->warn( __VA_ARGS__ )
#    define SR_ERROR( ... )    ::SoftRaster::Log::GetClientLogger()->error( __VA_ARGS__ )
#    define SR_CRITICAL( ... ) ::SoftRaster::Log::GetClientLogger()->critical( __VA_ARGS__ )
#endif
