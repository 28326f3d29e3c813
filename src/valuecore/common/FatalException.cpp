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

#include "common/FatalException.hpp"

#include <sstream>

namespace valuecore {

FatalException::FatalException(std::string const& message, const char *filename, unsigned long lineno) :
    std::runtime_error(message), m_reason(message), m_filename(filename), m_lineno(lineno) {
    std::ostringstream frames;
    StackTrace(2).streamLocalTrace(frames, "");
    std::string line;
    std::istringstream lines(frames.str());
    while (std::getline(lines, line)) {
        m_traces.push_back(line);
    }
    VC_ERROR("FatalException at %s:%lu: %s", filename, lineno, message.c_str());
}

}
