/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Artur Kedzierski
 *  \author  Wagner Truppel
 *  \author  Walt Howard
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2002-2004 Dr. Johannes Ruscheinski.
 *  Copyright 2015 Universitätsbibliothek Tübingen
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
#pragma once


#include <stdexcept>
#include <string>
#include <cstring>
#include <strings.h>


/** \namespace  StringUtil
 *  \brief      Various string processing functions.
 */
namespace StringUtil {


const std::string EmptyString;

// Only 7-bit characters so that trimming never cuts into a multibyte UTF-8 sequence.
const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Returns what tolower(3) would return in the "C" locale.  Bytes outside of A-Z are returned unchanged. */
inline char ASCIIToLower(const char ch) {
    return (ch >= 'A' and ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}


/** \brief  Convert a string to lowercase, affecting only the ASCII letters A-Z (modifies its argument). */
std::string &ASCIIToLower(std::string * const s);


/** \brief  Convert a string to lowercase, affecting only the ASCII letters A-Z (does not modify its argument). */
inline std::string ASCIIToLower(const std::string &s) {
    std::string temp_s(s);
    return ASCIIToLower(&temp_s);
}


/** \brief   Remove all occurences of a set of characters from the end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string RightTrim(const std::string &trim_set, std::string * const s);


/** \brief  Remove all trailing occurences of "trim_char" from "s". */
std::string RightTrim(std::string * const s, char trim_char = ' ');


/** \brief   Remove all occurences of a set of characters from the beginning of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string LeftTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &trim_set, const std::string &s) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


/** \brief  Removes leading and trailing whitespace (modifies its argument). */
inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


/** \brief  Removes leading and trailing whitespace (does not modify its argument). */
inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief  Converts "s" to an unsigned number.
 *  \return True if the conversion succeeded, else false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \brief  Like the above but throws a std::runtime_error if "s" can't be converted. */
unsigned ToUnsigned(const std::string &s, const unsigned base = 10);


/** \brief  Split a string around a delimiter.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  A list to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 *
 *  Splits "source" around the character in "delimiter" and return the resulting list of fields in "fields."
 *  A source of N delimiters yields N + 1 fields unless empty ones are being suppressed, e.g. "a::b" results in
 *  "a", "" and "b".  The empty string yields no fields at all.
 */
template<typename InsertableContainer> unsigned Split(const std::string &source, const char delimiter,
                                                      InsertableContainer * const container,
                                                      const bool suppress_empty_components = true)
{
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find(delimiter, start));
        const std::string field(next_delimiter == std::string::npos ? source.substr(start)
                                                                   : source.substr(start, next_delimiter - start));
        if (not field.empty() or not suppress_empty_components) {
            container->insert(container->end(), field);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief  Split a string, then trim the component substrings' whitespace.
 *  \param  s                     The string to split.
 *  \param  field_separator       The delimiter character to split around.
 *  \param  container             A string container to hold the parts (e.g. std::list<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> unsigned SplitThenTrimWhite(const std::string &s, const char field_separator,
                                                                   InsertableContainer * const container,
                                                                   const bool suppress_empty_words = true)
{
    InsertableContainer untrimmed_words;
    Split(s, field_separator, &untrimmed_words, /* suppress_empty_components = */ false);

    container->clear();
    unsigned count(0);
    for (auto word : untrimmed_words) {
        TrimWhite(&word);
        if (word.empty() and suppress_empty_words)
            continue;
        container->insert(container->end(), word);
        ++count;
    }

    return count;
}


/** \brief  Join a "list" of words to form a single string.
 *  \param  source     The container of strings that are to be joined.
 *  \param  separator  The text to insert between the "source" elements.
 *  \return The combined result.
 */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    for (auto word(source.begin()); word != source.end(); ++word) {
        if (word != source.begin())
            dest += separator;
        dest += *word;
    }

    return dest;
}


template<typename StringContainer> inline std::string Join(const StringContainer &source, const char separator) {
    return Join(source, std::string(1, separator));
}


/** \brief  Returns what isdigit would return in the "C" locale. */
inline bool IsDigit(const char ch) {
    // Caution: the following code assumes a character set where 0-9 are consecutive, e.g. ANSI, ASCII
    //          or EBCDIC etc.
    return ch >= '0' and ch <= '9';
}


/** \brief  Returns what isalpha would return in the "C" locale. */
inline bool IsAsciiLetter(const char ch) {
    return (ch >= 'a' and ch <= 'z') or (ch >= 'A' and ch <= 'Z');
}


/** \brief  Returns what isalnum would return in the "C" locale. */
inline bool IsAlphanumeric(const char ch) {
    return IsAsciiLetter(ch) or IsDigit(ch);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** Turns C-style escape sequences, e.g. "\n" (that's a literal backslash followed by an "n"), back into the characters
    they stand for.  Throws a std::runtime_error on malformed sequences. */
std::string CStyleUnescape(const std::string &escaped_text);


} // namespace StringUtil
