//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Gateway version as configured by the build (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpgate {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Version components from the build (project VERSION in CMakeLists.txt).
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; reported as serverInfo.version by the executable.
std::string getVersionString();

} // namespace mcpgate
