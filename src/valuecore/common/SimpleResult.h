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

#include <memory>
#include <string>
#include <vector>

#include "common/ResultInterface.h"
#include "common/Value.hpp"

namespace valuecore {

/**
 * In-memory result. Rows are shared between shallow copies; each copy
 * keeps its own cursor.
 */
class SimpleResult : public ResultInterface {
public:
    SimpleResult();

    /** Appends a column; only valid before the first row is added. */
    void addColumn(std::string const& name, TypeInfo const& type);

    /** Throws SQLException (21S02) when the row width differs from the column count. */
    void addRow(std::vector<Value> const& row);

    void reset();
    bool next();
    bool hasNext() const;
    const std::vector<Value>& currentRow() const;
    int64_t getRowCount() const;
    int getVisibleColumnCount() const;
    std::string getColumnName(int column) const;
    TypeInfo getColumnType(int column) const;
    std::shared_ptr<ResultInterface> createShallowCopy() const;

private:
    struct Column {
        std::string name;
        TypeInfo type;
    };

    std::shared_ptr<std::vector<Column> > m_columns;
    std::shared_ptr<std::vector<std::vector<Value> > > m_rows;
    int64_t m_rowId;
};

}
