/* This file is part of ValueCore.
 * Copyright (C) 2008-2022 Volt Active Data Inc.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with ValueCore.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

/**
 * Debug logging for the value core. These are printf() calls turned on/off
 * by the VC_LOG_LEVEL compile option, so there is no runtime cost when the
 * logging is off. Use the VC_XXX_ENABLED macros defined here to eliminate
 * whole debug blocks from the final binary.
*/

#include "common/StackTrace.h"

#include <cassert>
#include <string>
#include <ctime>
#include <cstdio>
#include <cstdint>
#include <pthread.h>
#include <sys/time.h>

// Log levels.
#define VC_LEVEL_OFF    1000
#define VC_LEVEL_ERROR  500
#define VC_LEVEL_WARN   400
#define VC_LEVEL_INFO   300
#define VC_LEVEL_DEBUG  200
#define VC_LEVEL_TRACE  100
#define VC_LEVEL_ALL    0

#define VC_LOG_TIME_FORMAT "%Y-%m-%d %T"

// Compile Option
#ifndef VC_LOG_LEVEL
    #ifndef NDEBUG
        #define VC_LOG_LEVEL VC_LEVEL_ERROR
    #else // release builds
        #define VC_LOG_LEVEL VC_LEVEL_OFF
    #endif
#endif

#if !defined(__FUNCTION__) && !defined(__GNUC__)
    #define __FUNCTION__ ""
#endif

#define _VC_LOG(lvl, msg, ...) do {                                             \
        struct timeval __now__;                                                 \
        ::gettimeofday(&__now__, NULL);                                         \
        struct tm __curTime__;                                                  \
        ::localtime_r(&__now__.tv_sec, &__curTime__);                           \
        char __time_str__[32];                                                  \
        ::strftime(__time_str__, 32, VC_LOG_TIME_FORMAT, &__curTime__);         \
        ::printf("[%s] [T%lu] [%s:%d:%s()] %s,%03jd - " msg, lvl,               \
                (unsigned long) ::pthread_self(),                               \
                __FILE__, __LINE__, __FUNCTION__,                               \
                __time_str__, (intmax_t) __now__.tv_usec / 1000, ##__VA_ARGS__);\
        ::fflush(stdout);                                                       \
    } while (0)

#define VC_LOG(lvl, msg, ...) _VC_LOG(lvl, msg  "\n", ##__VA_ARGS__)

#define VC_LOG_STACK(lvl) _VC_LOG(lvl, "STACK TRACE\n%s", valuecore::StackTrace::stringStackTrace("    ").c_str())

#ifdef VC_ERROR_ENABLED
    #undef VC_ERROR_ENABLED
#endif
#if VC_LOG_LEVEL<=VC_LEVEL_ERROR
    #define VC_ERROR_ENABLED
    #define VC_ERROR(...) VC_LOG("ERROR", __VA_ARGS__)
    #define VC_ERROR_STACK() VC_LOG_STACK("ERROR")
#else
    #define VC_ERROR(...) ((void)0)
    #define VC_ERROR_STACK() ((void)0)
#endif

#ifdef VC_WARN_ENABLED
    #undef VC_WARN_ENABLED
#endif
#if VC_LOG_LEVEL<=VC_LEVEL_WARN
    #define VC_WARN_ENABLED
    #define VC_WARN(...) VC_LOG("WARN", __VA_ARGS__)
    #define VC_WARN_STACK() VC_LOG_STACK("WARN")
#else
    #define VC_WARN(...) ((void)0)
    #define VC_WARN_STACK() ((void)0)
#endif

#ifdef VC_INFO_ENABLED
    #undef VC_INFO_ENABLED
#endif
#if VC_LOG_LEVEL<=VC_LEVEL_INFO
    #define VC_INFO_ENABLED
    #define VC_INFO(...) VC_LOG("INFO", __VA_ARGS__)
    #define VC_INFO_STACK() VC_LOG_STACK("INFO")
#else
    #define VC_INFO(...) ((void)0)
    #define VC_INFO_STACK() ((void)0)
#endif

#ifdef VC_DEBUG_ENABLED
    #undef VC_DEBUG_ENABLED
#endif
#if VC_LOG_LEVEL<=VC_LEVEL_DEBUG
    #define VC_DEBUG_ENABLED
    #define VC_DEBUG(...) VC_LOG("DEBUG", __VA_ARGS__)
    #define VC_DEBUG_STACK() VC_LOG_STACK("DEBUG")
#else
    #define VC_DEBUG(...) ((void)0)
    #define VC_DEBUG_STACK() ((void)0)
#endif

#ifdef VC_TRACE_ENABLED
    #undef VC_TRACE_ENABLED
#endif
#if VC_LOG_LEVEL<=VC_LEVEL_TRACE
    #define VC_TRACE_ENABLED
    #define VC_TRACE(...) VC_LOG("TRACE", __VA_ARGS__)
    #define VC_TRACE_STACK() VC_LOG_STACK("TRACE")
#else
    #define VC_TRACE(...) ((void)0)
    #define VC_TRACE_STACK() ((void)0)
#endif

#define PRINT_STACK_TRACE() VC_LOG_STACK("UNKWN")

namespace valuecore {
// Writes "[LEVEL] [Tthread] [file:line:func()] time - " to stdout.
void outputLogHeader(const char *file, int line, const char *func, int level);
}

// A custom assert macro that adds stacktrace on message
#ifdef NDEBUG
#define vcassert(expr) (void)0
#else
extern char __vc_assert_failure_msg__[4096];
#define vcassert(expr)            \
   if(! (expr)) {                 \
       snprintf(__vc_assert_failure_msg__, sizeof __vc_assert_failure_msg__,                   \
               "%s\n(STACK TRACE:\n%s)\n", #expr,                                              \
               valuecore::StackTrace::stringStackTrace("\t").c_str());                         \
       __vc_assert_failure_msg__[sizeof __vc_assert_failure_msg__ - 1] = '\0';                 \
       __assert_fail(__vc_assert_failure_msg__, __FILE__, __LINE__, __ASSERT_FUNCTION);        \
   }
#endif
