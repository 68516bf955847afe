#ifndef TUNSTACK_CONFIG_H
#define TUNSTACK_CONFIG_H

#define TUNSTACK_VERSION_MAJOR 1
#define TUNSTACK_VERSION_MINOR 0
#define TUNSTACK_VERSION_PATCH 0
#define TUNSTACK_VERSION_STRING "1.0.0"

#if defined(_WIN32) && defined(TUNSTACK_SHARED)
    #ifdef TUNSTACK_BUILDING_LIBRARY
        #define TUNSTACK_API __declspec(dllexport)
    #else
        #define TUNSTACK_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) && defined(TUNSTACK_SHARED)
    #define TUNSTACK_API __attribute__((visibility("default")))
#else
    #define TUNSTACK_API
#endif

#endif // TUNSTACK_CONFIG_H
