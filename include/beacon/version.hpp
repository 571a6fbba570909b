/*
 * Version macros for Beacon.
 *
 * The build defines BEACON_VERSION_MAJOR/MINOR/PATCH/STRING from the project version;
 * the fallbacks below only apply when a translation unit is compiled outside of it.
 */

#pragma once

#ifndef BEACON_VERSION_MAJOR
#define BEACON_VERSION_MAJOR 0
#endif

#ifndef BEACON_VERSION_MINOR
#define BEACON_VERSION_MINOR 0
#endif

#ifndef BEACON_VERSION_PATCH
#define BEACON_VERSION_PATCH 0
#endif

#ifndef BEACON_VERSION_STRING
#define BEACON_VERSION_STRING "0.0.0+dev"
#endif

#if defined(__cplusplus)
namespace beacon {
namespace version {
constexpr int major_v = BEACON_VERSION_MAJOR;
constexpr int minor_v = BEACON_VERSION_MINOR;
constexpr int patch_v = BEACON_VERSION_PATCH;
constexpr const char* string_v = BEACON_VERSION_STRING;
} // namespace version
} // namespace beacon
#endif
