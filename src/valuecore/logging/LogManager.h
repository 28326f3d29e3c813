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

#ifndef VALUECORE_LOGMANAGER_H_
#define VALUECORE_LOGMANAGER_H_
#include "Logger.h"
#include "LogDefs.h"
#include "LogProxy.h"
#include <stdint.h>
#include <string>
#include <pthread.h>


namespace valuecore {

/**
 * A LogManager owns the fixed set of value core loggers and the proxy they
 * write through. Constructing one binds it to the calling thread, where
 * getThreadLogger finds it.
 */
class LogManager {
public:

    /**
     * Takes ownership of 'proxy' and binds the new manager to this thread.
     */
    LogManager(LogProxy *proxy);

    /**
     * Frees the log proxy and unbinds the manager if it is still the one
     * bound to this thread.
     */
    ~LogManager();

    inline const Logger* getLogger(LoggerId id) const {
        switch (id) {
        case LOGGERID_VALUE:
            return &m_valueLogger;
        case LOGGERID_CACHE:
            return &m_cacheLogger;
        case LOGGERID_HOST:
            return &m_hostLogger;
        default:
            return NULL;
        }
    }

    /**
     * Update the log levels of the loggers. Three bits per logger, in
     * LoggerId order starting at the low bits.
     */
    inline void setLogLevels(int64_t logLevels) {
        m_valueLogger.m_level = static_cast<LogLevel>(7 & logLevels);
        m_cacheLogger.m_level = static_cast<LogLevel>(((7 << 3) & logLevels) >> 3);
        m_hostLogger.m_level = static_cast<LogLevel>(((7 << 6) & logLevels) >> 6);
    }

    inline const LogProxy* getLogProxy() const {
        return m_proxy;
    }

    /**
     * Makes this manager the one getThreadLogger uses on the calling thread.
     */
    void bindToThread();

    /**
     * Retrieve a logger by ID from the LogManager bound to this thread. With
     * no manager bound, a logger that drops everything is returned.
     */
    static const Logger* getThreadLogger(LoggerId id);

    static LogLevel getLogLevel(LoggerId id) {
        return getThreadLogger(id)->m_level;
    }

    static const char* loggerName(LoggerId id);
    /** LOGGERID_INVALID for an unknown name. */
    static LoggerId loggerIdFromName(std::string const& name);
    static const char* levelName(LogLevel level);
    /** Case-insensitive; false for an unknown name. */
    static bool levelFromName(std::string const& name, LogLevel* level);

    /** The packed word that sets every logger to 'level'. */
    static int64_t packLogLevels(LogLevel valueLevel, LogLevel cacheLevel, LogLevel hostLevel) {
        return static_cast<int64_t>(valueLevel)
            | (static_cast<int64_t>(cacheLevel) << 3)
            | (static_cast<int64_t>(hostLevel) << 6);
    }

private:
    static LogManager* getThreadLogManager();

    const LogProxy *m_proxy;
    Logger m_valueLogger;
    Logger m_cacheLogger;
    Logger m_hostLogger;
};
}
#endif /* VALUECORE_LOGMANAGER_H_ */
