#pragma once

#if defined(_WIN32) || defined(_WIN64)
#define CADENCE_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define CADENCE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define CADENCE_PLATFORM_APPLE 1
#endif

// Visibility
#if defined(_WIN32)
#ifdef CADENCE_EXPORTS
#define CADENCE_API __declspec(dllexport)
#else
#define CADENCE_API __declspec(dllimport)
#endif
#else
#define CADENCE_API __attribute__((visibility("default")))
#endif

#define CADENCE_NODISCARD [[nodiscard]]

#define CADENCE_UNUSED(x)   (void)(x)
#define CADENCE_LIKELY(x)   __builtin_expect(!!(x), 1)
#define CADENCE_UNLIKELY(x) __builtin_expect(!!(x), 0)
