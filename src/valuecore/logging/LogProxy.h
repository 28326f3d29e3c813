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

#ifndef VALUECORE_LOGPROXY_H_
#define VALUECORE_LOGPROXY_H_
#include "LogDefs.h"

namespace valuecore {

/**
 * A log proxy receives statements from loggers and writes them to wherever
 * the embedding process keeps its log.
 */
class LogProxy {
public:

    /**
     * Log a statement on behalf of the specified logger at the specified log level
     * @param loggerId ID of the logger that received this statement
     * @param level Log level of the statement
     * @param statement null terminated UTF-8 string containing the statement to log
     */
    virtual void log(LoggerId loggerId, LogLevel level, const char *statement) const = 0;

    virtual ~LogProxy() {}
};

}
#endif /* VALUECORE_LOGPROXY_H_ */
