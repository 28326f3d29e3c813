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

#include "common/SQLException.h"
#include "common/SimpleResult.h"
#include "common/debuglog.h"

namespace valuecore {

SimpleResult::SimpleResult()
    : m_columns(std::make_shared<std::vector<Column> >()),
      m_rows(std::make_shared<std::vector<std::vector<Value> > >()),
      m_rowId(-1) {
}

void SimpleResult::addColumn(std::string const& name, TypeInfo const& type) {
    vcassert(m_rows->empty());
    Column column = { name, type };
    m_columns->push_back(column);
}

void SimpleResult::addRow(std::vector<Value> const& row) {
    if (row.size() != m_columns->size()) {
        throwSQLException(SQLException::column_count_does_not_match,
                          "Column count does not match: row has %d values, result has %d columns",
                          static_cast<int>(row.size()), static_cast<int>(m_columns->size()));
    }
    m_rows->push_back(row);
}

void SimpleResult::reset() {
    m_rowId = -1;
}

bool SimpleResult::next() {
    const int64_t count = getRowCount();
    if (m_rowId < count) {
        m_rowId++;
    }
    return m_rowId < count;
}

bool SimpleResult::hasNext() const {
    return m_rowId < getRowCount() - 1;
}

const std::vector<Value>& SimpleResult::currentRow() const {
    vcassert(m_rowId >= 0 && m_rowId < getRowCount());
    return (*m_rows)[m_rowId];
}

int64_t SimpleResult::getRowCount() const {
    return static_cast<int64_t>(m_rows->size());
}

int SimpleResult::getVisibleColumnCount() const {
    return static_cast<int>(m_columns->size());
}

std::string SimpleResult::getColumnName(int column) const {
    return (*m_columns)[column].name;
}

TypeInfo SimpleResult::getColumnType(int column) const {
    return (*m_columns)[column].type;
}

std::shared_ptr<ResultInterface> SimpleResult::createShallowCopy() const {
    std::shared_ptr<SimpleResult> copy = std::make_shared<SimpleResult>();
    copy->m_columns = m_columns;
    copy->m_rows = m_rows;
    return copy;
}

}
