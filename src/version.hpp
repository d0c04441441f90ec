#pragma once

// Build/version info.
//
// CMake defines DWARFSLAYER_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef DWARFSLAYER_VERSION
#define DWARFSLAYER_VERSION "dev"
#endif

#ifndef DWARFSLAYER_APPNAME
#define DWARFSLAYER_APPNAME "Dwarf Slayer"
#endif
