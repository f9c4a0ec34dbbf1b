#pragma once

/**
 * @file Version.h
 * @brief flurry release number.
 *
 * Keep in step with `project(flurry VERSION ...)` in CMakeLists.txt.
 */

#define FLURRY_VERSION_MAJOR 0
#define FLURRY_VERSION_MINOR 1
#define FLURRY_VERSION_PATCH 0

/// Single comparable number, e.g. 0.1.0 -> 100.
#define FLURRY_VERSION_NUMBER \
	(FLURRY_VERSION_MAJOR * 10000 + FLURRY_VERSION_MINOR * 100 + FLURRY_VERSION_PATCH)

#define FLURRY_VERSION_STR_(x) #x
#define FLURRY_VERSION_STR(x) FLURRY_VERSION_STR_(x)

/// "major.minor.patch", e.g. "0.1.0".
#define FLURRY_VERSION                      \
	FLURRY_VERSION_STR(FLURRY_VERSION_MAJOR) "." \
	FLURRY_VERSION_STR(FLURRY_VERSION_MINOR) "." \
	FLURRY_VERSION_STR(FLURRY_VERSION_PATCH)
