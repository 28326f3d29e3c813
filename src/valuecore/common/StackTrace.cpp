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

#include <execinfo.h>
#include <cstring>
#include <cxxabi.h>   // for abi
#include <cstdlib>    // for malloc/free

#include "common/StackTrace.h"

namespace valuecore {

namespace {

const int MAX_FRAMES = 128;

// Turns one backtrace_symbols() line "binary(mangled+0x1f) [addr]" into a
// readable function name, or returns the raw line when no symbol is present.
std::string demangleFrame(const char* symbol) {
    const char *begin = NULL, *end = NULL;
    for (const char *j = symbol; *j; ++j) {
        if (*j == '(') {
            begin = j;
        } else if (*j == '+') {
            end = j;
        }
    }
    if (begin == NULL || end == NULL || end <= begin) {
        return std::string(symbol);
    }
    std::string mangled(begin + 1, end);
    int status = 0;
    // Note: __cxa_demangle mallocs its result.
    char *demangled = abi::__cxa_demangle(mangled.c_str(), NULL, NULL, &status);
    if (demangled == NULL) {
        // treat it like a C function with no args
        return mangled + "()";
    }
    std::string result(demangled);
    ::free(demangled);
    return result;
}

}

StackTrace::StackTrace(uint32_t skipFrames) {
    void *traces[MAX_FRAMES];
    for (int i = 0; i < MAX_FRAMES; i++) traces[i] = NULL; // silence valgrind
    const int numTraces = backtrace(traces, MAX_FRAMES);
    m_traceSymbols = backtrace_symbols(traces, numTraces);
    if (m_traceSymbols == NULL) {
        m_traces.push_back("<backtrace unavailable>");
        return;
    }
    for (int ii = static_cast<int>(skipFrames); ii < numTraces; ii++) {
        m_traces.push_back(demangleFrame(m_traceSymbols[ii]));
    }
}

StackTrace::~StackTrace() {
    ::free(m_traceSymbols);
}

void StackTrace::printMangledAndUnmangledToFile(FILE *targetFile) {
    StackTrace st(0);
    const int numFrames = static_cast<int>(st.m_traces.size());
    // Ignore the stack frames specific to StackTrace object
    fprintf(targetFile, "ValueCore Backtrace (%d stack frames)\n", numFrames - 2);
    if (st.m_traceSymbols != NULL) {
        for (int ii = 2; ii < numFrames; ii++) {
            fprintf(targetFile, "raw[%d]: %s\n", ii, st.m_traceSymbols[ii]);
        }
    }
    for (int ii = 2; ii < numFrames; ii++) {
        fprintf(targetFile, "demangled[%d]: %s\n", ii, st.m_traces[ii].c_str());
    }
}

} // namespace valuecore
