#pragma once
#ifndef MIMIC_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define MIMIC_PLATFORM_WINDOWS 1
#else
#define MIMIC_PLATFORM_WINDOWS 0
#endif
#if MIMIC_PLATFORM_WINDOWS
#if defined(MIMIC_BUILD_SHARED)
#define MIMIC_API __declspec(dllexport)
#elif defined(MIMIC_SHARED)
#define MIMIC_API __declspec(dllimport)
#else
#define MIMIC_API
#endif
#else
#if defined(MIMIC_BUILD_SHARED) || defined(MIMIC_SHARED)
#if __GNUC__ >= 4
#define MIMIC_API __attribute__((visibility("default")))
#else
#define MIMIC_API
#endif // __GNUC__
#else
#define MIMIC_API
#endif // MIMIC_BUILD_SHARED || MIMIC_SHARED
#endif // MIMIC_PLATFORM_WINDOWS
#endif // MIMIC_API
