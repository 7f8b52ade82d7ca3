#pragma once

#include <HashCoreUtilsExports.h>

/**
 * Initializes spdlog for HashCore binaries.
 * Creates a colored stderr logger named "hashcore", makes it the default
 * logger and sets an Abseil-like "[severity] message" pattern.
 *
 * @note Calling this more than once is a no-op.
 */
extern HashCoreUtils_API void HashCore_SpdlogInit();

// Deregister and cleanup spdlog
extern HashCoreUtils_API void HashCore_SpdlogDeInit();
