/** \file    MiscUtil.cc
 *  \brief   Implementation of miscellaneous utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2016-2021 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "MiscUtil.h"
#include <cstdlib>
#include <cstring>
#include <cxxabi.h>
#include <execinfo.h>


namespace MiscUtil {


std::string SafeGetEnv(const char * const name) {
    const char * const value(::getenv(name));
    return value == nullptr ? "" : value;
}


std::vector<std::string> GetCallStack() {
    std::vector<std::string> call_stack;

    const int MAX_ADDR_COUNT(100);
    void *addresses[MAX_ADDR_COUNT];
    const int address_count(::backtrace(addresses, MAX_ADDR_COUNT));
    char **symbols(::backtrace_symbols(addresses, address_count));
    if (symbols == nullptr)
        return call_stack;

    for (int addr_no(0); addr_no < address_count; ++addr_no) {
        char *symbol_start(std::strchr(symbols[addr_no], '('));
        if (symbol_start == nullptr)
            continue;
        ++symbol_start; // Skip over the opening parenthesis.
        // Symbols end at a plus sign which is followed by an address.
        char *plus(std::strchr(symbol_start, '+'));
        if (plus == nullptr)
            continue;
        *plus = '\0';
        int status;
        char *demangled_name(abi::__cxa_demangle(symbol_start, nullptr, nullptr, &status));
        if (status == 0)
            call_stack.emplace_back(demangled_name);
        ::free(reinterpret_cast<void *>(demangled_name));
    }
    ::free(reinterpret_cast<void *>(symbols));

    return call_stack;
}


} // namespace MiscUtil
