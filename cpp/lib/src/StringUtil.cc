/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Wagner Truppel
 *  \author  Paul Vander Griend
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2002-2005 Dr. Johannes Ruscheinski.
 *  Copyright 2017 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "StringUtil.h"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include "util.h"


namespace StringUtil {


std::string &ASCIIToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = ASCIIToLower(ch);

    return *s;
}


std::string RightTrim(const std::string &trim_set, std::string * const s) {
    size_t original_length = s->length();
    if (original_length == 0)
        return *s;

    size_t trimmed_length = original_length;
    const char * const set = trim_set.c_str();
    while (trimmed_length > 0 and ::strchr(set, (*s)[trimmed_length - 1]) != nullptr)
        --trimmed_length;

    if (trimmed_length < original_length)
        s->resize(trimmed_length);

    return *s;
}


std::string RightTrim(std::string * const s, char trim_char) {
    size_t trimmed_length = s->length();
    while (trimmed_length > 0 and (*s)[trimmed_length - 1] == trim_char)
        --trimmed_length;
    s->resize(trimmed_length);

    return *s;
}


std::string LeftTrim(const std::string &trim_set, std::string * const s) {
    size_t no_of_leading_trim_chars(0);
    const char * const set = trim_set.c_str();
    while (no_of_leading_trim_chars < s->length() and std::strchr(set, (*s)[no_of_leading_trim_chars]) != nullptr)
        ++no_of_leading_trim_chars;

    if (no_of_leading_trim_chars > 0)
        s->erase(0, no_of_leading_trim_chars);

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    RightTrim(trim_set, s);
    return LeftTrim(trim_set, s);
}


unsigned ToUnsigned(const std::string &s, const unsigned base) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\" to an unsigned!");

    return n;
}


// ToUnsigned -- convert a string to an unsigned number.
//
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and isspace(*ch))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul = std::strtoul(s.c_str(), &end_ptr, base);
    *n = static_cast<unsigned>(ul);

    const bool success((*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX));
    errno = 0;
    return success;
}


std::string CStyleUnescape(const std::string &escaped_text) {
    std::string unescaped_text;
    for (std::string::const_iterator ch(escaped_text.begin()); ch != escaped_text.end(); ++ch) {
        if (*ch != '\\') {
            unescaped_text += *ch;
            continue;
        }

        ++ch;
        if (unlikely(ch == escaped_text.end()))
            throw std::runtime_error("in StringUtil::CStyleUnescape: unexpected end of escaped string!");
        if (*ch == 'x' or *ch == 'X') { // Hexadecimal escape.
            std::string hex_digits;
            for (unsigned i(0); i < 2; ++i) {
                ++ch;
                if (unlikely(ch == escaped_text.end()))
                    throw std::runtime_error("in StringUtil::CStyleUnescape: unexpected end of hex escape!");
                hex_digits += *ch;
            }
            unsigned char_value;
            if (unlikely(not StringUtil::ToUnsigned(hex_digits, &char_value, 16)))
                throw std::runtime_error("in StringUtil::CStyleUnescape: bad hex escape (\\x" + hex_digits + ")!");
            unescaped_text += static_cast<char>(char_value);
        } else if (*ch >= '0' and *ch <= '7') { // Octal escape.
            std::string octal_digits(1, *ch);
            for (unsigned i(0); i < 2; ++i) {
                ++ch;
                if (unlikely(ch == escaped_text.end()))
                    throw std::runtime_error("in StringUtil::CStyleUnescape: unexpected end of octal escape!");
                octal_digits += *ch;
            }
            unsigned char_value;
            if (unlikely(not StringUtil::ToUnsigned(octal_digits, &char_value, 8)))
                throw std::runtime_error("in StringUtil::CStyleUnescape: bad octal escape (\\" + octal_digits + ")!");
            unescaped_text += static_cast<char>(char_value);
        } else {
            switch (*ch) {
            case 'n':
                unescaped_text += '\n';
                break;
            case 't':
                unescaped_text += '\t';
                break;
            case 'b':
                unescaped_text += '\b';
                break;
            case 'r':
                unescaped_text += '\r';
                break;
            case 'f':
                unescaped_text += '\f';
                break;
            case 'v':
                unescaped_text += '\v';
                break;
            case 'a':
                unescaped_text += '\a';
                break;
            case '\\':
                unescaped_text += '\\';
                break;
            case '\'':
                unescaped_text += '\'';
                break;
            case '"':
                unescaped_text += '"';
                break;
            default:
                throw std::runtime_error("in StringUtil::CStyleUnescape: unknown escape '\\" + std::string(1, *ch) + "'!");
            }
        }
    }

    return unescaped_text;
}


} // namespace StringUtil
