// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file semdiff_config.h
/// @brief Centralized compile-time configuration for semdiff and immer.
///
/// It MUST be included before any immer header so every translation unit
/// sees the same immer settings. All semdiff public headers include it first.
///
/// Unlike a single-threaded value store, engines and rule chains are shared
/// between threads that run comparisons concurrently, so immer keeps its
/// atomic reference counting (IMMER_NO_THREAD_SAFETY stays 0).

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(SEMDIFF_CONFIGURED)
#error "immer headers were included before semdiff/semdiff_config.h. " \
       "Please include semdiff headers before any direct immer includes."
#endif

#define SEMDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// Tagged nodes only add runtime assertion data; not needed here.
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Diagnostics
//
// When SEMDIFF_VERBOSE_LOG is non-zero, failed accessors, duplicate YAML
// keys without a handler, unparsable HTML and verify() mismatches are
// reported on stderr (see diagnostics.h).
//
// Defaults: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef SEMDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define SEMDIFF_VERBOSE_LOG 0
#  else
#    define SEMDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Text Output
// ============================================================

/// Spaces per nesting level in indented JSON and canonical text.
#ifndef SEMDIFF_JSON_INDENT
#define SEMDIFF_JSON_INDENT 2
#endif

#ifdef SEMDIFF_CONFIG_VERBOSE
#if SEMDIFF_VERBOSE_LOG
#pragma message("semdiff: verbose diagnostics ENABLED")
#else
#pragma message("semdiff: verbose diagnostics DISABLED")
#endif
#endif // SEMDIFF_CONFIG_VERBOSE
