/*
 * Version macros for tankobon.
 *
 * The build passes TANKOBON_VERSION_* as compile definitions; the defaults
 * below keep a bare compile of any single file working.
 */

#pragma once

#ifndef TANKOBON_VERSION_MAJOR
#define TANKOBON_VERSION_MAJOR 0
#endif

#ifndef TANKOBON_VERSION_MINOR
#define TANKOBON_VERSION_MINOR 0
#endif

#ifndef TANKOBON_VERSION_PATCH
#define TANKOBON_VERSION_PATCH 0
#endif

#ifndef TANKOBON_VERSION_STRING
#define TANKOBON_VERSION_STRING "0.0.0+dev"
#endif

namespace tankobon::version {
constexpr int major_v = TANKOBON_VERSION_MAJOR;
constexpr int minor_v = TANKOBON_VERSION_MINOR;
constexpr int patch_v = TANKOBON_VERSION_PATCH;
constexpr const char* string_v = TANKOBON_VERSION_STRING;
} // namespace tankobon::version
