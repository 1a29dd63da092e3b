/** \file   LoginNameGenerator.cc
 *  \brief  Implementation of class LoginNameGenerator.
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
#include "LoginNameGenerator.h"
#include "StringUtil.h"
#include "util.h"


constexpr unsigned LoginNameGenerator::DEFAULT_MAX_BASE_LENGTH;


// \return The length in bytes of the UTF-8 sequence starting at "s[pos]".  Anything that isn't a complete and
//         well-formed lead/continuation sequence is treated as a single-byte character.
static size_t CharacterLength(const std::string &s, const size_t pos) {
    const unsigned char lead(static_cast<unsigned char>(s[pos]));
    size_t sequence_length;
    if (lead < 0x80)
        return 1;
    else if ((lead & 0xE0u) == 0xC0u)
        sequence_length = 2;
    else if ((lead & 0xF0u) == 0xE0u)
        sequence_length = 3;
    else if ((lead & 0xF8u) == 0xF0u)
        sequence_length = 4;
    else
        return 1;

    if (pos + sequence_length > s.length())
        return 1;
    for (size_t i(pos + 1); i < pos + sequence_length; ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0u) != 0x80u)
            return 1;
    }

    return sequence_length;
}


static inline std::string FirstCharacter(const std::string &s) {
    return s.empty() ? "" : s.substr(0, CharacterLength(s, 0));
}


// Truncates "s" to at most "max_length" characters.
static void TruncateToCharacterCount(std::string * const s, const size_t max_length) {
    size_t pos(0), character_count(0);
    while (pos < s->length() and character_count < max_length) {
        pos += CharacterLength(*s, pos);
        ++character_count;
    }
    s->resize(pos);
}


LoginNameGenerator::LoginNameGenerator(const unsigned max_base_length): max_base_length_(max_base_length) {
    if (unlikely(max_base_length_ == 0))
        LOG_ERROR("the maximum base name length must be at least 1!");
}


std::string LoginNameGenerator::makeBaseName(const UserRecord &record) const {
    std::string base_name(FirstCharacter(record.forename_));
    if (record.hasMiddleName())
        base_name += FirstCharacter(record.middle_name_);
    base_name += record.surname_;

    StringUtil::ASCIIToLower(&base_name);
    TruncateToCharacterCount(&base_name, max_base_length_);

    return base_name;
}


std::string LoginNameGenerator::generate(const UserRecord &record) {
    const std::string base_name(makeBaseName(record));

    const auto base_name_and_count(base_name_to_count_map_.find(base_name));
    if (base_name_and_count == base_name_to_count_map_.end()) {
        base_name_to_count_map_.emplace(base_name, 0);
        LOG_DEBUG("\"" + record.id_ + "\" -> \"" + base_name + "\"");
        return base_name;
    }

    const unsigned suffix(++base_name_and_count->second);
    const std::string login_name(base_name + std::to_string(suffix));
    LOG_DEBUG("\"" + record.id_ + "\" -> \"" + login_name + "\" (base name \"" + base_name + "\" was already taken)");

    return login_name;
}


unsigned LoginNameGenerator::getCount(const std::string &base_name) const {
    const auto base_name_and_count(base_name_to_count_map_.find(base_name));
    return (base_name_and_count == base_name_to_count_map_.end()) ? 0 : base_name_and_count->second + 1;
}

