#pragma once

// Build/version info.
//
// CMake defines FATECORE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef FATECORE_VERSION
#define FATECORE_VERSION "dev"
#endif

#ifndef FATECORE_APPNAME
#define FATECORE_APPNAME "FateCore"
#endif
