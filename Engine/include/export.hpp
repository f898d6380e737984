#pragma once

#if defined(_WIN32)
    #if defined(RUNESTREAM_EXPORT)
        #define RUNESTREAM_API __declspec(dllexport)
    #else
        #define RUNESTREAM_API __declspec(dllimport)
    #endif
#else
    #define RUNESTREAM_API __attribute__((visibility("default")))
#endif
