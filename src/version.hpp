#pragma once

// Build/version info.
//
// CMake defines UNDERCROFT_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef UNDERCROFT_VERSION
#define UNDERCROFT_VERSION "dev"
#endif

#ifndef UNDERCROFT_APPNAME
#define UNDERCROFT_APPNAME "Undercroft"
#endif
