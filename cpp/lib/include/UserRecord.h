/** \file   UserRecord.h
 *  \brief  The user records that login names are generated from and a parser for their textual form.
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


#include <memory>
#include <string>
#include "RegexMatcher.h"


struct UserRecord {
    std::string id_;
    std::string forename_;
    std::string middle_name_; // Empty if the person has no middle name.
    std::string surname_;
    std::string department_;

public:
    UserRecord() = default;
    UserRecord(const std::string &id, const std::string &forename, const std::string &middle_name, const std::string &surname,
               const std::string &department)
        : id_(id), forename_(forename), middle_name_(middle_name), surname_(surname), department_(department) { }

    inline bool hasMiddleName() const { return not middle_name_.empty(); }
};


/** \class UserRecordParser
 *  \brief Turns lines of the form ID:Forename[:Middlename]:Surname:Department into UserRecords.
 *
 *  Lines with 4 fields have no middle name, lines with 5 fields have a possibly empty middle name.  All fields are
 *  stripped of surrounding whitespace.  A UserRecordParser is immutable after construction and may be shared.
 */
class UserRecordParser {
    char field_separator_;
    std::unique_ptr<ThreadSafeRegexMatcher> id_matcher_;

public:
    static constexpr char DEFAULT_FIELD_SEPARATOR = ':';
    static constexpr unsigned MIN_FIELD_COUNT = 4;
    static constexpr unsigned MAX_FIELD_COUNT = 5;

public:
    /** \param id_pattern  If non-empty, a PCRE that every ID has to match. */
    explicit UserRecordParser(const char field_separator = DEFAULT_FIELD_SEPARATOR, const std::string &id_pattern = "");

    inline char getFieldSeparator() const { return field_separator_; }
    inline bool hasIdPattern() const { return id_matcher_ != nullptr; }

    /** \return True if "line" contains nothing but whitespace.  Such lines are not records and not errors either. */
    static bool IsBlank(const std::string &line);

    /** \brief  Parses a single input line.
     *  \param  line     The line without its terminating newline.  A trailing carriage return is ignored.
     *  \param  record   Where to store the result.  Only valid if we returned true.
     *  \param  err_msg  Where to store the reason if we returned false.
     *  \return False if "line" has the wrong number of fields, if a required field is empty or if the ID doesn't
     *          match the ID pattern.
     */
    bool parse(const std::string &line, UserRecord * const record, std::string * const err_msg) const;
};
