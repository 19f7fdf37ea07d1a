#pragma once

#if defined(_MSC_VER) && !defined(__clang__)
#define LOCUS_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define LOCUS_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define LOCUS_ALWAYS_INLINE inline
#endif

#ifndef LOCUS_BASE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(LOCUS_BASE_SHARED_BUILD)
#define LOCUS_BASE_API __declspec(dllexport)
#elif defined(LOCUS_BASE_SHARED)
#define LOCUS_BASE_API __declspec(dllimport)
#else
#define LOCUS_BASE_API
#endif
#define LOCUS_BASE_LOCAL
#else
#if defined(LOCUS_BASE_SHARED_BUILD) || defined(LOCUS_BASE_SHARED)
#define LOCUS_BASE_API __attribute__((visibility("default")))
#else
#define LOCUS_BASE_API
#endif
#define LOCUS_BASE_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef LOCUS_BASE_LOCAL
#define LOCUS_BASE_LOCAL
#endif
