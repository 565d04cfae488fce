#pragma once

#ifdef _WIN32
// Suppress C4251 warnings for STL containers in exported classes
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

#ifdef MEDIAFETCH_STATIC
    // For static library linking, no import/export needed
    #define MEDIAFETCH_API
#elif defined(_WIN32)
    #ifdef MEDIAFETCH_BUILD
        #define MEDIAFETCH_API __declspec(dllexport)
    #else
        #define MEDIAFETCH_API __declspec(dllimport)
    #endif
#else
    // For Linux/Unix systems, use standard visibility attributes
    #ifdef MEDIAFETCH_BUILD
        #define MEDIAFETCH_API __attribute__((visibility("default")))
    #else
        #define MEDIAFETCH_API
    #endif
#endif

#ifdef _WIN32
#pragma warning(pop)
#endif
