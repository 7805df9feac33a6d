#pragma once

#include "shared/core_defines.hpp"
#include <string>

namespace RD
{

struct EngineInitInfo
{
    bool coloredStdout = true;
    // copies of all log messages are written here when non-empty
    std::string logFilename;
};

bool EngineInitialize( const EngineInitInfo& info = {} );

void EngineShutdown();

} // namespace RD
