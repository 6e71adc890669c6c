/*

config.hpp
----------

Global build configuration for syncgen.

Define SYNCGEN_NO_EXCEPTIONS to disable exception-based wrappers.

*/

#pragma once

#if defined(SYNCGEN_NO_EXCEPTIONS)
#define SYNCGEN_THROWING_ENABLED 0
#else
#define SYNCGEN_THROWING_ENABLED 1
#endif
