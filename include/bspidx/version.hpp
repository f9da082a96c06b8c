/*
 * Fallback version header for bspidx
 *
 * The build system passes the version macros on the command line; these
 * defaults keep the sources compiling when it does not.
 */

#pragma once

#ifndef BSPIDX_VERSION_MAJOR
#define BSPIDX_VERSION_MAJOR 2
#endif

#ifndef BSPIDX_VERSION_MINOR
#define BSPIDX_VERSION_MINOR 0
#endif

// Reported in the store metadata and in meta.json; the desktop consumer keys on it.
#ifndef BSPIDX_VERSION_STRING
#define BSPIDX_VERSION_STRING "2.0-server"
#endif

#if defined(__cplusplus)
namespace bspidx {
namespace version {
constexpr int major_v = BSPIDX_VERSION_MAJOR;
constexpr int minor_v = BSPIDX_VERSION_MINOR;
constexpr const char* string_v = BSPIDX_VERSION_STRING;
} // namespace version
} // namespace bspidx
#endif
