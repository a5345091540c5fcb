/*
 * Fallback version header for upsync
 *
 * The build system passes UPSYNC_VERSION_* definitions; these defaults keep the code
 * compiling when it does not.
 */

#pragma once

#ifndef UPSYNC_VERSION_MAJOR
#define UPSYNC_VERSION_MAJOR 0
#endif

#ifndef UPSYNC_VERSION_MINOR
#define UPSYNC_VERSION_MINOR 0
#endif

#ifndef UPSYNC_VERSION_PATCH
#define UPSYNC_VERSION_PATCH 0
#endif

#ifndef UPSYNC_VERSION_STRING
#define UPSYNC_VERSION_STRING "0.0.0+dev"
#endif
