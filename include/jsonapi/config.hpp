#pragma once
#ifndef JSONAPI_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define JSONAPI_PLATFORM_WINDOWS 1
#else
#define JSONAPI_PLATFORM_WINDOWS 0
#endif
#if JSONAPI_PLATFORM_WINDOWS
#if defined(JSONAPI_BUILD_SHARED)
#define JSONAPI_API __declspec(dllexport)
#elif defined(JSONAPI_SHARED)
#define JSONAPI_API __declspec(dllimport)
#else
#define JSONAPI_API
#endif
#else
#if defined(JSONAPI_BUILD_SHARED) || defined(JSONAPI_SHARED)
#if __GNUC__ >= 4
#define JSONAPI_API __attribute__((visibility("default")))
#else
#define JSONAPI_API
#endif // __GNUC__
#else
#define JSONAPI_API
#endif // JSONAPI_BUILD_SHARED || JSONAPI_SHARED
#endif // JSONAPI_PLATFORM_WINDOWS
#endif // JSONAPI_API

#ifndef JSONAPI_MEDIA_TYPE
#define JSONAPI_MEDIA_TYPE "application/vnd.api+json"
#endif // JSONAPI_MEDIA_TYPE
