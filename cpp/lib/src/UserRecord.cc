/** \file   UserRecord.cc
 *  \brief  Implementation of the user record parser.
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
#include "UserRecord.h"
#include <vector>
#include "StringUtil.h"
#include "util.h"


constexpr char UserRecordParser::DEFAULT_FIELD_SEPARATOR;
constexpr unsigned UserRecordParser::MIN_FIELD_COUNT;
constexpr unsigned UserRecordParser::MAX_FIELD_COUNT;


UserRecordParser::UserRecordParser(const char field_separator, const std::string &id_pattern): field_separator_(field_separator) {
    if (not id_pattern.empty())
        id_matcher_.reset(new ThreadSafeRegexMatcher(id_pattern));
}


bool UserRecordParser::IsBlank(const std::string &line) {
    return line.find_first_not_of(StringUtil::WHITE_SPACE) == std::string::npos;
}


bool UserRecordParser::parse(const std::string &line, UserRecord * const record, std::string * const err_msg) const {
    err_msg->clear();

    std::string trimmed_line(line);
    StringUtil::RightTrim(&trimmed_line, '\r');

    std::vector<std::string> fields;
    const unsigned field_count(StringUtil::Split(trimmed_line, field_separator_, &fields, /* suppress_empty_components = */ false));
    if (field_count < MIN_FIELD_COUNT or field_count > MAX_FIELD_COUNT) {
        *err_msg = "expected " + std::to_string(MIN_FIELD_COUNT) + " or " + std::to_string(MAX_FIELD_COUNT) + " fields, found "
                   + std::to_string(field_count);
        return false;
    }

    for (auto &field : fields)
        StringUtil::TrimWhite(&field);

    record->id_         = fields[0];
    record->forename_   = fields[1];
    if (field_count == MAX_FIELD_COUNT) {
        record->middle_name_ = fields[2];
        record->surname_     = fields[3];
        record->department_  = fields[4];
    } else {
        record->middle_name_.clear();
        record->surname_    = fields[2];
        record->department_ = fields[3];
    }

    if (record->id_.empty())
        *err_msg = "missing ID";
    else if (record->forename_.empty())
        *err_msg = "missing forename";
    else if (record->surname_.empty())
        *err_msg = "missing surname";
    else if (id_matcher_ != nullptr and not id_matcher_->match(record->id_))
        *err_msg = "invalid ID \"" + record->id_ + "\"";

    return err_msg->empty();
}
