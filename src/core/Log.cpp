#include "core/Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace SoftRaster
{

    Ref<spdlog::logger> Log::s_CoreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_ClientLogger = nullptr;

    void Log::Init()
    {
        if( s_CoreLogger != nullptr )
        {
            return;
        }

        spdlog::set_pattern( "%^[%T] %n: %v%$" );

        // A host application may already own loggers with these names.
        s_CoreLogger = spdlog::get( "CORE" );
        if( !s_CoreLogger )
            s_CoreLogger = spdlog::stdout_color_mt( "CORE" );

        s_ClientLogger = spdlog::get( "CLIENT" );
        if( !s_ClientLogger )
            s_ClientLogger = spdlog::stdout_color_mt( "CLIENT" );

        s_CoreLogger->set_level( spdlog::level::trace );
        s_ClientLogger->set_level( spdlog::level::trace );

        SR_CORE_INFO( "Logging system initialized." );
    }

} // namespace SoftRaster
