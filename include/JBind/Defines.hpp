#pragma once

// Symbol visibility for shared builds. JBIND_SHARED_BUILD is set while compiling the library itself,
// JBIND_SHARED by consumers linking against the shared library.
#ifndef JBIND_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(JBIND_SHARED_BUILD)
#define JBIND_API __declspec(dllexport)
#elif defined(JBIND_SHARED)
#define JBIND_API __declspec(dllimport)
#else
#define JBIND_API
#endif
#else
#if defined(JBIND_SHARED_BUILD) || defined(JBIND_SHARED)
#define JBIND_API __attribute__((visibility("default")))
#else
#define JBIND_API
#endif
#endif
#endif
