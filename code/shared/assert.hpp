#pragma once

#include "shared/logger.hpp"
#include "shared/platform_defines.hpp"
#include <cstdlib>

#if USING( DEVELOPMENT_BUILD )

#define RD_ASSERT( X, ... )                                                                                          \
    do                                                                                                               \
    {                                                                                                                \
        if ( !( X ) ) [[unlikely]]                                                                                   \
        {                                                                                                            \
            Logger_Log( LogSeverity::ERR, TerminalColorCode::RED, TerminalEmphasisCode::NONE,                        \
                "Failed assertion: (%s) at line %d in file %s", #X, __LINE__, __FILE__ );                            \
            __VA_OPT__( Logger_Log( LogSeverity::ERR, TerminalColorCode::RED, TerminalEmphasisCode::NONE,            \
                "Assert message: " __VA_ARGS__ ); )                                                                  \
            abort();                                                                                                 \
        }                                                                                                            \
    } while ( 0 )

#if USING( DEBUG_BUILD )
#define RD_DBG_ASSERT( X, ... ) RD_ASSERT( X __VA_OPT__(, ) __VA_ARGS__ )
#else // #if USING( DEBUG_BUILD )
#define RD_DBG_ASSERT( ... ) \
    do                       \
    {                        \
    } while ( 0 )
#endif // #else // #if USING( DEBUG_BUILD )

#else // #if USING( DEVELOPMENT_BUILD )

#define RD_DBG_ASSERT( ... ) \
    do                       \
    {                        \
    } while ( 0 )

#define RD_ASSERT( ... ) \
    do                   \
    {                    \
    } while ( 0 )

#endif // #else // #if USING( DEVELOPMENT_BUILD )
