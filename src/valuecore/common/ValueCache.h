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

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "common/Value.hpp"

namespace valuecore {

struct ValueBody;

/**
 * A direct-mapped table of recently created small values. intern()
 * returns an equal value already in the table when there is one, so that
 * repeated constants share one body. The table is a cache only: losing
 * entries (clear(), a colliding value, a racing writer) costs memory but
 * never changes a result.
 *
 * Slots are read and written with atomic shared_ptr operations, so one
 * cache may be shared by several threads without a lock.
 */
class ValueCache {
public:
    static const int DEFAULT_SIZE = 1024;

    /** 'size' must be a positive power of two; otherwise SQLException 22023. */
    explicit ValueCache(int size = DEFAULT_SIZE);
    ~ValueCache();

    ValueCache(ValueCache const&) = delete;
    ValueCache& operator=(ValueCache const&) = delete;

    /**
     * Returns the cached instance equal to 'value' (same type, equals())
     * if the value's slot holds one; otherwise stores 'value' in the slot
     * and returns it. A disabled cache returns 'value'.
     */
    Value intern(Value const& value);

    /** Drops the table; it is recreated by the next intern(). */
    void clear();

    /** Called under memory pressure; same as clear(). */
    void releaseMemory() {
        clear();
    }

    void setEnabled(bool enabled);
    bool isEnabled() const {
        return m_enabled.load();
    }

    int getSize() const {
        return m_size;
    }
    int64_t getHits() const {
        return m_hits.load();
    }
    int64_t getMisses() const {
        return m_misses.load();
    }

    /**
     * Makes this cache the one ValueFactory interns through on the calling
     * thread. The caller keeps ownership and must unbind before deleting
     * the cache; the destructor unbinds it from the destroying thread.
     */
    void bindToThread();
    static void unbindFromThread();
    /** The cache bound to this thread, or NULL. */
    static ValueCache* getThreadCache();

private:
    typedef std::vector<std::shared_ptr<const ValueBody> > Table;

    std::shared_ptr<Table> getTable();

    const int m_size;
    std::shared_ptr<Table> m_table;
    std::atomic<bool> m_enabled;
    std::atomic<int64_t> m_hits;
    std::atomic<int64_t> m_misses;
};

}
