/*

config.hpp
----------

Global build configuration for gmailxx.

Define GMAILXX_NO_EXCEPTIONS to disable exception-based wrappers.
Define GMAILXX_USE_STD_REGEX to match provider markers with <regex> instead of Boost.Regex.

*/

#pragma once

#if defined(GMAILXX_NO_EXCEPTIONS)
#define GMAILXX_THROWING_ENABLED 0
#else
#define GMAILXX_THROWING_ENABLED 1
#endif

#if !defined(GMAILXX_USE_STD_REGEX)
#define GMAILXX_USE_STD_REGEX 0
#endif

// The classes keep default visibility when the library is used from a shared object built with hidden symbols.
#if !defined(GMAILXX_EXPORT)
#if defined(__GNUC__) && !defined(_WIN32)
#define GMAILXX_EXPORT __attribute__((visibility("default")))
#else
#define GMAILXX_EXPORT
#endif
#endif
