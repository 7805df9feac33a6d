#pragma once

#include "shared/core_defines.hpp"

// CMake passes exactly one of RD_BUILD_DEBUG, RD_BUILD_RELEASE or RD_BUILD_SHIP.
// Anything not explicitly shipping is considered a development build.
#if defined( RD_BUILD_DEBUG )
#define DEBUG_BUILD IN_USE
#define DEVELOPMENT_BUILD IN_USE
#define SHIP_BUILD NOT_IN_USE
#elif defined( RD_BUILD_SHIP )
#define DEBUG_BUILD NOT_IN_USE
#define DEVELOPMENT_BUILD NOT_IN_USE
#define SHIP_BUILD IN_USE
#else
#define DEBUG_BUILD NOT_IN_USE
#define DEVELOPMENT_BUILD IN_USE
#define SHIP_BUILD NOT_IN_USE
#endif
