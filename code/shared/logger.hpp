#pragma once

#include "shared/platform_defines.hpp"
#include <cstdio>
#include <string>

enum class LogSeverity
{
    DEBUG,
    WARN,
    ERR
};

enum class TerminalColorCode
{
    RED     = 31,
    GREEN   = 32,
    YELLOW  = 33,
    BLUE    = 34,
    DEFAULT = 39
};

enum class TerminalEmphasisCode
{
    NONE      = 0,
    BOLD      = 1,
    UNDERLINE = 4
};

#if USING( SHIP_BUILD )

#define LOG( ... ) \
    do             \
    {              \
    } while ( 0 )
#define LOG_WARN( ... ) \
    do                  \
    {                   \
    } while ( 0 )
#define LOG_ERR( ... ) \
    do                 \
    {                  \
    } while ( 0 )

#else // #if USING( SHIP_BUILD )

#define LOG( fmt, ... ) \
    Logger_Log( LogSeverity::DEBUG, TerminalColorCode::GREEN, TerminalEmphasisCode::NONE, fmt __VA_OPT__(, ) __VA_ARGS__ )
#define LOG_WARN( fmt, ... ) \
    Logger_Log( LogSeverity::WARN, TerminalColorCode::YELLOW, TerminalEmphasisCode::NONE, fmt __VA_OPT__(, ) __VA_ARGS__ )
#define LOG_ERR( fmt, ... ) \
    Logger_Log( LogSeverity::ERR, TerminalColorCode::RED, TerminalEmphasisCode::NONE, fmt __VA_OPT__(, ) __VA_ARGS__ )

#endif // #else // #if USING( SHIP_BUILD )

void Logger_Init();

void Logger_Shutdown();

void Logger_AddLogLocation( const std::string& name, FILE* file, bool useColors = true );

// opens (and truncates) the file. Output to files is never colored
void Logger_AddLogLocation( const std::string& name, const std::string& filename );

// appends a newline to every message
void Logger_Log( LogSeverity severity, TerminalColorCode color, TerminalEmphasisCode emphasis, const char* fmt, ... );
