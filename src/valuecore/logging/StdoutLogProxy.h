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

#ifndef VALUECORE_STDOUTLOGPROXY_H_
#define VALUECORE_STDOUTLOGPROXY_H_
#include "LogDefs.h"
#include "LogManager.h"
#include "LogProxy.h"
#include <iostream>

namespace valuecore {
/**
 * Writes every statement to stdout as "LOGGER - LEVEL - statement".
 */
class StdoutLogProxy : public LogProxy {
public:
    void log(LoggerId loggerId, LogLevel level, const char *statement) const {
        std::cout << LogManager::loggerName(loggerId) << " - "
                  << LogManager::levelName(level) << " - " << statement << std::endl;
    }
    virtual ~StdoutLogProxy() {}
};
}

#endif /* VALUECORE_STDOUTLOGPROXY_H_ */
