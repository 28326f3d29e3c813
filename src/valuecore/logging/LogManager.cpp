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
#include "LogManager.h"

#include <boost/algorithm/string.hpp>

/**
 * Thread local key for storing references to thread specific log managers.
 */
static pthread_key_t m_key;
static pthread_once_t m_keyOnce = PTHREAD_ONCE_INIT;

namespace valuecore {

static void createThreadLocalKey() {
    (void)pthread_key_create(&m_key, NULL);
}

// Used on threads that never bound a manager: no proxy, so nothing is written.
static const Logger s_silentLogger(NULL, LOGGERID_INVALID);

LogManager* LogManager::getThreadLogManager() {
    (void)pthread_once(&m_keyOnce, createThreadLocalKey);
    return static_cast<LogManager*>(pthread_getspecific(m_key));
}

const Logger* LogManager::getThreadLogger(LoggerId id) {
    LogManager* manager = getThreadLogManager();
    if (manager == NULL) {
        return &s_silentLogger;
    }
    const Logger* logger = manager->getLogger(id);
    return logger == NULL ? &s_silentLogger : logger;
}

LogManager::LogManager(LogProxy *proxy) :
    m_proxy(proxy),
    m_valueLogger(proxy, LOGGERID_VALUE),
    m_cacheLogger(proxy, LOGGERID_CACHE),
    m_hostLogger(proxy, LOGGERID_HOST) {
    bindToThread();
}

LogManager::~LogManager() {
    if (getThreadLogManager() == this) {
        pthread_setspecific(m_key, NULL);
    }
    delete m_proxy;
}

void LogManager::bindToThread() {
    (void)pthread_once(&m_keyOnce, createThreadLocalKey);
    pthread_setspecific(m_key, static_cast<const void *>(this));
}

const char* LogManager::loggerName(LoggerId id) {
    switch (id) {
    case LOGGERID_VALUE:
        return "VALUE";
    case LOGGERID_CACHE:
        return "CACHE";
    case LOGGERID_HOST:
        return "HOST";
    default:
        return "UNKNOWN";
    }
}

LoggerId LogManager::loggerIdFromName(std::string const& name) {
    const std::string upper = boost::algorithm::to_upper_copy(name);
    if (upper == "VALUE") {
        return LOGGERID_VALUE;
    }
    if (upper == "CACHE") {
        return LOGGERID_CACHE;
    }
    if (upper == "HOST") {
        return LOGGERID_HOST;
    }
    return LOGGERID_INVALID;
}

const char* LogManager::levelName(LogLevel level) {
    switch (level) {
    case LOGLEVEL_ALL:
        return "ALL";
    case LOGLEVEL_TRACE:
        return "TRACE";
    case LOGLEVEL_DEBUG:
        return "DEBUG";
    case LOGLEVEL_INFO:
        return "INFO";
    case LOGLEVEL_WARN:
        return "WARN";
    case LOGLEVEL_ERROR:
        return "ERROR";
    case LOGLEVEL_FATAL:
        return "FATAL";
    case LOGLEVEL_OFF:
        return "OFF";
    default:
        return "UNKNOWN";
    }
}

bool LogManager::levelFromName(std::string const& name, LogLevel* level) {
    const std::string upper = boost::algorithm::to_upper_copy(name);
    for (int ii = LOGLEVEL_ALL; ii <= LOGLEVEL_OFF; ii++) {
        if (upper == levelName(static_cast<LogLevel>(ii))) {
            *level = static_cast<LogLevel>(ii);
            return true;
        }
    }
    return false;
}

}
