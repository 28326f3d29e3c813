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

#include <pthread.h>

#include "common/SQLException.h"
#include "common/ValueBody.hpp"
#include "common/ValueCache.h"
#include "logging/LogManager.h"

/**
 * Thread local key for the cache ValueFactory uses on each thread.
 */
static pthread_key_t m_key;
static pthread_once_t m_keyOnce = PTHREAD_ONCE_INIT;

namespace valuecore {

static void createThreadLocalKey() {
    (void)pthread_key_create(&m_key, NULL);
}

ValueCache::ValueCache(int size)
    : m_size(size), m_enabled(true), m_hits(0), m_misses(0) {
    if (size <= 0 || (size & (size - 1)) != 0) {
        throwSQLException(SQLException::data_exception_invalid_parameter,
                          "Value cache size %d is not a power of two", size);
    }
    LogManager::getThreadLogger(LOGGERID_CACHE)->logf(LOGLEVEL_INFO,
            "Created value cache with %d slots", size);
}

ValueCache::~ValueCache() {
    if (getThreadCache() == this) {
        unbindFromThread();
    }
}

std::shared_ptr<ValueCache::Table> ValueCache::getTable() {
    std::shared_ptr<Table> table = std::atomic_load(&m_table);
    if (table == NULL) {
        // a racing thread may install its own table; either one will do
        table = std::make_shared<Table>(static_cast<size_t>(m_size));
        std::atomic_store(&m_table, table);
    }
    return table;
}

Value ValueCache::intern(Value const& value) {
    if (! m_enabled.load()) {
        return value;
    }
    std::shared_ptr<Table> table = getTable();
    std::shared_ptr<const ValueBody>& slot =
        (*table)[value.hashCode() & static_cast<std::size_t>(m_size - 1)];
    std::shared_ptr<const ValueBody> cached = std::atomic_load(&slot);
    if (cached != NULL && cached->m_type == value.getValueType()) {
        Value candidate(cached);
        if (candidate.equals(value)) {
            m_hits++;
            return candidate;
        }
    }
    std::atomic_store(&slot, value.m_body);
    m_misses++;
    return value;
}

void ValueCache::clear() {
    std::atomic_store(&m_table, std::shared_ptr<Table>());
    LogManager::getThreadLogger(LOGGERID_CACHE)->logf(LOGLEVEL_INFO,
            "Cleared value cache (%d slots, %jd hits, %jd misses)",
            m_size, (intmax_t) m_hits.load(), (intmax_t) m_misses.load());
}

void ValueCache::setEnabled(bool enabled) {
    m_enabled.store(enabled);
    if (! enabled) {
        clear();
    }
}

void ValueCache::bindToThread() {
    (void)pthread_once(&m_keyOnce, createThreadLocalKey);
    pthread_setspecific(m_key, static_cast<const void *>(this));
}

void ValueCache::unbindFromThread() {
    (void)pthread_once(&m_keyOnce, createThreadLocalKey);
    pthread_setspecific(m_key, NULL);
}

ValueCache* ValueCache::getThreadCache() {
    (void)pthread_once(&m_keyOnce, createThreadLocalKey);
    return static_cast<ValueCache*>(pthread_getspecific(m_key));
}

}
