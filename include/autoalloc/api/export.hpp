#pragma once

#if defined(_WIN32)
#if defined(AUTOALLOC_BUILD_DLL)
#define AUTOALLOC_API __declspec(dllexport)
#elif defined(AUTOALLOC_USE_DLL)
#define AUTOALLOC_API __declspec(dllimport)
#else
#define AUTOALLOC_API
#endif
#else
#define AUTOALLOC_API
#endif
