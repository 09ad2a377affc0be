//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers backed by the build's version definitions.
//==========================================================================================================
#include "mcpgate/version.h"

#include <format>

#ifndef MCPGATE_VERSION_MAJOR
#define MCPGATE_VERSION_MAJOR 0
#endif
#ifndef MCPGATE_VERSION_MINOR
#define MCPGATE_VERSION_MINOR 1
#endif
#ifndef MCPGATE_VERSION_PATCH
#define MCPGATE_VERSION_PATCH 0
#endif

namespace mcpgate {

VersionInfo getVersion() {
    return VersionInfo{MCPGATE_VERSION_MAJOR, MCPGATE_VERSION_MINOR, MCPGATE_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpgate
