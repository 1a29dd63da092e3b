/** \file   LoginNameGenerator.h
 *  \brief  Derives unique login names from user records.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <string>
#include <unordered_map>
#include "UserRecord.h"


/** \class LoginNameGenerator
 *  \brief Hands out login names that are unique among all names this instance has generated.
 *
 *  A base name consists of the first character of the forename, the first character of the middle name, if any, and
 *  the whole surname, lowercased and truncated to "max_base_length" characters.  The first record that yields a
 *  given base name gets the base name itself, the k-th one gets the base name followed by k - 1.  The results
 *  therefore depend on the order in which the records are presented.
 *  \note  Lowercasing only affects A-Z.  Characters are UTF-8 code points, so truncation never splits a multibyte
 *         sequence.  Invalid UTF-8 bytes count as one character each.
 */
class LoginNameGenerator {
    unsigned max_base_length_;
    std::unordered_map<std::string, unsigned> base_name_to_count_map_;

public:
    static constexpr unsigned DEFAULT_MAX_BASE_LENGTH = 8;

public:
    /** \note Aborts if "max_base_length" is zero. */
    explicit LoginNameGenerator(const unsigned max_base_length = DEFAULT_MAX_BASE_LENGTH);

    inline unsigned getMaxBaseLength() const { return max_base_length_; }

    // Doesn't register anything.
    std::string makeBaseName(const UserRecord &record) const;

    /** \return A login name for "record" that differs from all login names previously returned by this instance for
     *          records with a different base name or an earlier position in the sequence.
     */
    std::string generate(const UserRecord &record);

    /** \return How often "base_name" has been handed out by generate() so far. */
    unsigned getCount(const std::string &base_name) const;

    /** \return The number of distinct base names seen so far. */
    inline size_t size() const { return base_name_to_count_map_.size(); }

    inline void clear() { base_name_to_count_map_.clear(); }
};
