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

#include <cstdio>
#include <ostream>
#include <string>
#include <vector>
#include <stdexcept>

#include "common/debuglog.h"

#define throwFatalException(...) {                              \
    char msg[8192];                                             \
    snprintf(msg, sizeof msg, __VA_ARGS__);                     \
    msg[sizeof msg - 1] = '\0';                                 \
    throw valuecore::FatalException( msg, __FILE__, __LINE__);  \
}

namespace valuecore {

/**
 * Raised on evidence of a bug inside the value core itself (a corrupt type
 * tag, an impossible switch arm). Never used for bad user input; those are
 * SQLExceptions.
 */
class FatalException : public std::runtime_error {
public:
    FatalException(std::string const& message, const char *filename, unsigned long lineno);

    const std::string m_reason;
    const char *m_filename;
    const unsigned long m_lineno;
    std::vector<std::string> m_traces;
};

inline std::ostream& operator<<(std::ostream& out, const FatalException& fe) {
    out << fe.m_reason << ' ' << fe.m_filename << ':' << fe.m_lineno << std::endl;
    for (size_t ii = 0; ii < fe.m_traces.size(); ii++) {
        out << fe.m_traces[ii] << std::endl;
    }
    return out;
}

}
