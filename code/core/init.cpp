#include "core/init.hpp"
#include "shared/logger.hpp"

namespace RD
{

bool EngineInitialize( const EngineInitInfo& info )
{
    Logger_Init();
    Logger_AddLogLocation( "stdout", stdout, info.coloredStdout );
    if ( !info.logFilename.empty() )
    {
        Logger_AddLogLocation( "logfile", info.logFilename );
    }

    return true;
}

void EngineShutdown() { Logger_Shutdown(); }

} // namespace RD
