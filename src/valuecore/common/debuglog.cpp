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

#include "common/debuglog.h"

#ifndef NDEBUG
char __vc_assert_failure_msg__[4096];
#endif

namespace valuecore {

// Output log message header in this format: [type] [thread] [file:line:function] time -
// ex: [ERROR] [T140221] [somefile.cpp:123:doSome()] 2008-07-06 10:00:00 -
void outputLogHeader(const char *file, int line, const char *func, int level) {
    time_t t = ::time(NULL);
    struct tm curTime;
    ::localtime_r(&t, &curTime);
    char time_str[32];
    ::strftime(time_str, sizeof time_str, VC_LOG_TIME_FORMAT, &curTime);
    const char* type;
    switch (level) {
        case VC_LEVEL_ERROR:
            type = "ERROR";
            break;
        case VC_LEVEL_WARN:
            type = "WARN ";
            break;
        case VC_LEVEL_INFO:
            type = "INFO ";
            break;
        case VC_LEVEL_DEBUG:
            type = "DEBUG";
            break;
        case VC_LEVEL_TRACE:
            type = "TRACE";
            break;
        default:
            type = "UNKWN";
    }
    printf("[%s] [T%lu] [%s:%d:%s()] %s - ", type, (unsigned long) ::pthread_self(),
           file, line, func, time_str);
}

} // namespace valuecore
