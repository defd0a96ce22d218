#pragma once

#ifdef _WIN32
    #ifdef OREONPICKUP_EXPORTS
        #define OP_API __declspec(dllexport)
    #else
        #define OP_API __declspec(dllimport)
    #endif
#else
    #define OP_API __attribute__((visibility("default")))
#endif
