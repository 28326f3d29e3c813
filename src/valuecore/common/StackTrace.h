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
#include <cstdio>
#include <string>
#include <vector>
#include <sstream>

namespace valuecore {

/**
 * Demangled backtrace of the calling thread, captured at construction.
 */
class StackTrace {
public:
    // By default do not include the frame with the constructor
    StackTrace(uint32_t skipFrames = 1);
    ~StackTrace();

    static void printMangledAndUnmangledToFile(FILE *targetFile);

    static std::string stringStackTrace(std::string const& prefix) {
        std::ostringstream stacked;
        StackTrace(2).streamLocalTrace(stacked, prefix);
        return stacked.str();
    }

    void streamLocalTrace(std::ostream& stream, std::string const& prefix) const {
        for (size_t ii = 0; ii < m_traces.size(); ii++) {
            stream << prefix << m_traces[ii] << '\n';
        }
        stream.flush();
    }

    size_t frameCount() const {
        return m_traces.size();
    }

private:
    char** m_traceSymbols;
    std::vector<std::string> m_traces;
};

}
