#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#if defined( _WIN32 ) && defined( SR_SHARED )
#    ifdef SR_BUILD_LIB
#        define SR_API __declspec( dllexport )
#    else
#        define SR_API __declspec( dllimport )
#    endif
#else
#    define SR_API
#endif

namespace SoftRaster
{
    using bool_t = bool;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS       = 0,
        FAIL          = -1,
        INVALID_ARGS  = -3,
        OUT_OF_MEMORY = -10
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace SoftRaster

#include "core/Log.h"

#if defined( _MSC_VER )
#    define SR_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define SR_DEBUGBREAK() raise( SIGTRAP )
#else
#    define SR_DEBUGBREAK()
#endif

#ifdef SR_DEBUG
#    define SR_ENABLE_ASSERTS
#endif

#ifdef SR_ENABLE_ASSERTS
#    define SR_CORE_ASSERT( x, ... )                                                                                                                 \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                SR_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                               \
                SR_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define SR_CORE_ASSERT( x, ... )
#endif

// Propagates a failed Result to the caller.
#define SR_RETURN_IF_FAILED( x )                                                                                                                     \
    {                                                                                                                                                \
        ::SoftRaster::Result _sr_r = ( x );                                                                                                          \
        if( _sr_r != ::SoftRaster::Result::SUCCESS )                                                                                                 \
            return _sr_r;                                                                                                                            \
    }
