#pragma once

// Normally supplied by the build from the project version.
#ifndef MAKEMCP_VERSION_STRING
#define MAKEMCP_VERSION_STRING "0.4.0"
#endif

namespace makemcp {

inline constexpr const char* kVersion = MAKEMCP_VERSION_STRING;

} // namespace makemcp
