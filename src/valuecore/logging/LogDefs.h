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

#ifndef VALUECORE_LOGDEFS_H_
#define VALUECORE_LOGDEFS_H_

namespace valuecore {

/**
 * Identifiers for the loggers a LogManager carries. The ordinals also
 * give each logger's 3-bit slot in the packed level word accepted by
 * LogManager::setLogLevels.
 */
enum LoggerId {
    LOGGERID_VALUE,
    LOGGERID_CACHE,
    LOGGERID_HOST,
    LOGGERID_INVALID
};

/**
 * Supported log levels. 8 values fit in three bits.
 */
enum LogLevel {
    LOGLEVEL_ALL,
    LOGLEVEL_TRACE,
    LOGLEVEL_DEBUG,
    LOGLEVEL_INFO,
    LOGLEVEL_WARN,
    LOGLEVEL_ERROR,
    LOGLEVEL_FATAL,
    LOGLEVEL_OFF
};

}

#endif /* VALUECORE_LOGDEFS_H_ */
