#pragma once

#ifdef _WIN32
    #ifdef MCPHUB_BUILDING_DLL
        #define MCPHUB_API __declspec(dllexport)
    #else
        #define MCPHUB_API __declspec(dllimport)
    #endif
#else
    #define MCPHUB_API
#endif
