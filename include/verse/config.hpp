#pragma once
#ifndef VERSE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define VERSE_PLATFORM_WINDOWS 1
#else
#define VERSE_PLATFORM_WINDOWS 0
#endif
#if VERSE_PLATFORM_WINDOWS
#if defined(VERSE_BUILD_SHARED)
#define VERSE_API __declspec(dllexport)
#elif defined(VERSE_SHARED)
#define VERSE_API __declspec(dllimport)
#else
#define VERSE_API
#endif
#else
#if defined(VERSE_BUILD_SHARED) || defined(VERSE_SHARED)
#if __GNUC__ >= 4
#define VERSE_API __attribute__((visibility("default")))
#else
#define VERSE_API
#endif // __GNUC__
#else
#define VERSE_API
#endif // VERSE_BUILD_SHARED || VERSE_SHARED
#endif // VERSE_PLATFORM_WINDOWS
#endif // VERSE_API
