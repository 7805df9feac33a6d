#include "shared/logger.hpp"
#include "shared/assert.hpp"
#include <cstdarg>
#include <cstring>
#include <mutex>
#include <utility>

class LoggerOutputLocation
{
public:
    LoggerOutputLocation() = default;

    LoggerOutputLocation( const std::string& name, FILE* out, bool useColors = true ) :
        m_name( name ), m_outputStream( out ), m_colored( useColors ), m_ownsStream( false )
    {
    }

    LoggerOutputLocation( const std::string& name, const std::string& filename ) :
        m_name( name ), m_outputStream( fopen( filename.c_str(), "w" ) ), m_colored( false ), m_ownsStream( true )
    {
        if ( m_outputStream == nullptr )
        {
            printf( "Could not open log file '%s'\n", filename.c_str() );
        }
    }

    LoggerOutputLocation( const LoggerOutputLocation& )            = delete;
    LoggerOutputLocation& operator=( const LoggerOutputLocation& ) = delete;

    LoggerOutputLocation( LoggerOutputLocation&& log ) { *this = std::move( log ); }

    LoggerOutputLocation& operator=( LoggerOutputLocation&& log )
    {
        Close();
        m_name             = std::move( log.m_name );
        m_outputStream     = log.m_outputStream;
        m_colored          = log.m_colored;
        m_ownsStream       = log.m_ownsStream;
        log.m_outputStream = nullptr;

        return *this;
    }

    ~LoggerOutputLocation() { Close(); }

    void Close()
    {
        if ( m_outputStream && m_ownsStream )
        {
            fclose( m_outputStream );
        }
        m_outputStream = nullptr;
    }

    const std::string& GetName() const { return m_name; }
    FILE* GetOutputFile() const { return m_outputStream; }
    bool IsOutputColored() const { return m_colored; }

private:
    std::string m_name;
    FILE* m_outputStream = nullptr;
    bool m_colored       = true;
    bool m_ownsStream    = false;
};

#define MAX_NUM_LOGGER_OUTPUT_LOCATIONS 10
static std::mutex s_loggerLock;
static LoggerOutputLocation s_loggerLocations[MAX_NUM_LOGGER_OUTPUT_LOCATIONS];
static i32 s_numLogs = 0;

void Logger_Init() { s_numLogs = 0; }

void Logger_Shutdown()
{
    std::scoped_lock lock( s_loggerLock );
    for ( i32 i = 0; i < s_numLogs; ++i )
    {
        s_loggerLocations[i].Close();
    }
    s_numLogs = 0;
}

void Logger_AddLogLocation( const std::string& name, FILE* file, bool useColors )
{
    std::scoped_lock lock( s_loggerLock );
    RD_ASSERT( s_numLogs != MAX_NUM_LOGGER_OUTPUT_LOCATIONS );
    s_loggerLocations[s_numLogs] = LoggerOutputLocation( name, file, useColors );
    ++s_numLogs;
}

void Logger_AddLogLocation( const std::string& name, const std::string& filename )
{
    std::scoped_lock lock( s_loggerLock );
    RD_ASSERT( s_numLogs != MAX_NUM_LOGGER_OUTPUT_LOCATIONS );
    s_loggerLocations[s_numLogs] = LoggerOutputLocation( name, filename );
    ++s_numLogs;
}

void Logger_Log( LogSeverity severity, TerminalColorCode colorCode, TerminalEmphasisCode emphasisCode, const char* fmt, ... )
{
    const char* severityText = "";
    if ( severity == LogSeverity::WARN )
    {
        severityText = "WARNING  ";
    }
    else if ( severity == LogSeverity::ERR )
    {
        severityText = "ERROR    ";
    }

    char message[1024];
    va_list args;
    va_start( args, fmt );
    vsnprintf( message, sizeof( message ), fmt, args );
    va_end( args );

    char colorEncoding[16];
    snprintf( colorEncoding, sizeof( colorEncoding ), "\033[%d;%dm", static_cast<int>( emphasisCode ), static_cast<int>( colorCode ) );

    std::scoped_lock lock( s_loggerLock );
    for ( i32 i = 0; i < s_numLogs; ++i )
    {
        FILE* out = s_loggerLocations[i].GetOutputFile();
        if ( !out )
        {
            continue;
        }

        if ( s_loggerLocations[i].IsOutputColored() )
        {
            fprintf( out, "%s%s%s\033[0m\n", colorEncoding, severityText, message );
        }
        else
        {
            fprintf( out, "%s%s\n", severityText, message );
        }
        fflush( out );
    }
}
