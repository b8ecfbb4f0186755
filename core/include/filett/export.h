#pragma once

#ifdef _WIN32
    #ifdef FILETT_EXPORTS
        #define FTT_API __declspec(dllexport)
    #else
        #define FTT_API __declspec(dllimport)
    #endif
#else
    #define FTT_API __attribute__((visibility("default")))
#endif
