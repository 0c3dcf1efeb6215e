// api.h - Shared library export/import macros for semdiff

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the semdiff library.
///
/// - Building semdiff as a SHARED library:
///   CMake defines SEMDIFF_EXPORTS (private) and SEMDIFF_SHARED (public),
///   so everything marked SEMDIFF_API is exported.
/// - Consuming the SHARED library:
///   Link against the semdiff target; SEMDIFF_SHARED is propagated and
///   SEMDIFF_API turns into an import declaration on Windows.
/// - STATIC builds: SEMDIFF_API expands to nothing.
///
/// @code
/// class SEMDIFF_API DiffEngine { ... };
/// SEMDIFF_API std::string render_canonical(const Value& val);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef SEMDIFF_SHARED
        #ifdef SEMDIFF_EXPORTS
            #define SEMDIFF_API __declspec(dllexport)
        #else
            #define SEMDIFF_API __declspec(dllimport)
        #endif
    #else
        #define SEMDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(SEMDIFF_SHARED) && defined(SEMDIFF_EXPORTS)
        #define SEMDIFF_API __attribute__((visibility("default")))
    #else
        #define SEMDIFF_API
    #endif
#else
    #define SEMDIFF_API
#endif

