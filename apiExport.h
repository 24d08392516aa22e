#pragma once

// KDG_EXPORTS is defined while building the kdgraph library itself
#if defined(_WIN32) || defined(__CYGWIN__)
#define KDG_EXPORT __declspec(dllexport)
#define KDG_IMPORT __declspec(dllimport)
#define KDG_LOCAL
#elif defined(__GNUC__) || defined(__clang__)
#define KDG_EXPORT __attribute__((visibility("default")))
#define KDG_IMPORT __attribute__((visibility("default")))
#define KDG_LOCAL  __attribute__((visibility("hidden")))
#else
#define KDG_EXPORT
#define KDG_IMPORT
#define KDG_LOCAL
#endif

#ifdef KDG_EXPORTS
#define KDG_PUBLIC KDG_EXPORT
#else
#define KDG_PUBLIC KDG_IMPORT
#endif
