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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/TypeInfo.h"

namespace valuecore {

class Value;

/**
 * A forward-only cursor over the rows of a query result. RESULT_SET
 * values hold one of these; readers work on a createShallowCopy() so that
 * the shared instance is never moved.
 */
class ResultInterface {
public:
    virtual ~ResultInterface() {}

    /** Rewinds to before the first row. */
    virtual void reset() = 0;

    /** Advances to the next row; false when there is none. */
    virtual bool next() = 0;

    virtual bool hasNext() const = 0;

    /** The row next() last moved to. */
    virtual const std::vector<Value>& currentRow() const = 0;

    virtual int64_t getRowCount() const = 0;

    virtual int getVisibleColumnCount() const = 0;

    virtual std::string getColumnName(int column) const = 0;

    virtual TypeInfo getColumnType(int column) const = 0;

    /** A new cursor over the same rows, positioned before the first. */
    virtual std::shared_ptr<ResultInterface> createShallowCopy() const = 0;
};

}
