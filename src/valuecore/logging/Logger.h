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

#ifndef VALUECORE_LOGGER_H_
#define VALUECORE_LOGGER_H_
#include "LogDefs.h"
#include "LogProxy.h"
#include <cstdarg>
#include <cstdio>
#include <string>
#include "common/debuglog.h"

namespace valuecore {

/**
 * A logger holds the current level of one named log and forwards the
 * statements that pass it to a LogProxy.
 */
class Logger {
    friend class LogManager;
public:

    /**
     * Starts at LOGLEVEL_OFF.
     * @param proxy Log proxy where log statements should be forwarded to; may be NULL
     */
    inline Logger(LogProxy *proxy, LoggerId id) : m_level(LOGLEVEL_OFF), m_id(id), m_logProxy(proxy) {}

    inline bool isLoggable(LogLevel level) const {
        vcassert(level != LOGLEVEL_OFF && level != LOGLEVEL_ALL);
        return level >= m_level && m_logProxy != NULL;
    }

    inline void log(const LogLevel level, const std::string *statement) const {
        log(level, statement->c_str());
    }

    inline void log(const LogLevel level, const char *statement) const {
        vcassert(level != LOGLEVEL_OFF && level != LOGLEVEL_ALL);
        if (level >= m_level && m_logProxy != NULL) {
            m_logProxy->log(m_id, level, statement);
        }
    }

    /**
     * printf-style variant; the formatting is skipped when the level is
     * not loggable.
     */
    __attribute__((format(printf, 3, 4)))
    inline void logf(const LogLevel level, const char *format, ...) const {
        if (!isLoggable(level)) {
            return;
        }
        char msg[8192];
        va_list args;
        va_start(args, format);
        vsnprintf(msg, sizeof msg, format, args);
        va_end(args);
        msg[sizeof msg - 1] = '\0';
        m_logProxy->log(m_id, level, msg);
    }

    LogLevel getLevel() const { return m_level; }
    LoggerId getId() const { return m_id; }

private:
    LogLevel m_level;
    LoggerId m_id;
    const LogProxy *m_logProxy;
};

}
#endif /* VALUECORE_LOGGER_H_ */
