#pragma once
#ifndef YAMLSORT_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define YAMLSORT_PLATFORM_WINDOWS 1
#else
#define YAMLSORT_PLATFORM_WINDOWS 0
#endif
#if YAMLSORT_PLATFORM_WINDOWS
#if defined(YAMLSORT_BUILD_SHARED)
#define YAMLSORT_API __declspec(dllexport)
#elif defined(YAMLSORT_SHARED)
#define YAMLSORT_API __declspec(dllimport)
#else
#define YAMLSORT_API
#endif
#else
#if defined(YAMLSORT_BUILD_SHARED) || defined(YAMLSORT_SHARED)
#if __GNUC__ >= 4
#define YAMLSORT_API __attribute__((visibility("default")))
#else
#define YAMLSORT_API
#endif // __GNUC__
#else
#define YAMLSORT_API
#endif // YAMLSORT_BUILD_SHARED || YAMLSORT_SHARED
#endif // YAMLSORT_PLATFORM_WINDOWS
#endif // YAMLSORT_API
