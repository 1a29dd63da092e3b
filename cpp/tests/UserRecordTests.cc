/** \brief Test cases for UserRecordParser
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
#include <string>
#include "UnitTest.h"
#include "UserRecord.h"


TEST(four_fields) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("4563:Jozef:Murgas:Development", &record, &err_msg));
    CHECK_EQ(err_msg, "");
    CHECK_EQ(record.id_, "4563");
    CHECK_EQ(record.forename_, "Jozef");
    CHECK_FALSE(record.hasMiddleName());
    CHECK_EQ(record.surname_, "Murgas");
    CHECK_EQ(record.department_, "Development");
}


TEST(five_fields) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("1234:Jozef:Miloslav:Hurban:Legal", &record, &err_msg));
    CHECK_EQ(record.id_, "1234");
    CHECK_EQ(record.forename_, "Jozef");
    CHECK_TRUE(record.hasMiddleName());
    CHECK_EQ(record.middle_name_, "Miloslav");
    CHECK_EQ(record.surname_, "Hurban");
    CHECK_EQ(record.department_, "Legal");
}


TEST(empty_middle_name) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("4563:Jozef::Murgas:Development", &record, &err_msg));
    CHECK_FALSE(record.hasMiddleName());
    CHECK_EQ(record.surname_, "Murgas");
    CHECK_EQ(record.department_, "Development");
}


TEST(empty_department) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("7:Ann:Lee:", &record, &err_msg));
    CHECK_EQ(record.department_, "");
}


TEST(wrong_field_counts) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;

    CHECK_FALSE(parser.parse("12:Jozef:Hurban", &record, &err_msg));
    CHECK_EQ(err_msg, "expected 4 or 5 fields, found 3");

    CHECK_FALSE(parser.parse("1:a:b:c:d:e", &record, &err_msg));
    CHECK_EQ(err_msg, "expected 4 or 5 fields, found 6");

    CHECK_FALSE(parser.parse("nonsense", &record, &err_msg));
    CHECK_EQ(err_msg, "expected 4 or 5 fields, found 1");
}


TEST(missing_required_fields) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;

    CHECK_FALSE(parser.parse(":Jozef:Murgas:Development", &record, &err_msg));
    CHECK_EQ(err_msg, "missing ID");

    CHECK_FALSE(parser.parse("1:   :Murgas:Development", &record, &err_msg));
    CHECK_EQ(err_msg, "missing forename");

    CHECK_FALSE(parser.parse("1:Jozef:M: \t:Development", &record, &err_msg));
    CHECK_EQ(err_msg, "missing surname");
}


TEST(whitespace_is_trimmed) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse(" 42 :  Jozef\t: Murgas :  Development ", &record, &err_msg));
    CHECK_EQ(record.id_, "42");
    CHECK_EQ(record.forename_, "Jozef");
    CHECK_EQ(record.surname_, "Murgas");
    CHECK_EQ(record.department_, "Development");
}


TEST(carriage_return_is_ignored) {
    const UserRecordParser parser;
    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("42:Jozef:Murgas:Development\r", &record, &err_msg));
    CHECK_EQ(record.department_, "Development");
}


TEST(custom_field_separator) {
    const UserRecordParser parser(';');
    CHECK_EQ(parser.getFieldSeparator(), ';');

    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("42;Jozef;Miloslav;Hurban;Legal", &record, &err_msg));
    CHECK_EQ(record.middle_name_, "Miloslav");
    CHECK_FALSE(parser.parse("42:Jozef:Miloslav:Hurban:Legal", &record, &err_msg));
}


TEST(id_pattern) {
    const UserRecordParser parser(':', "^[0-9]+$");
    CHECK_TRUE(parser.hasIdPattern());

    UserRecord record;
    std::string err_msg;
    CHECK_TRUE(parser.parse("1234:Jozef:Murgas:Development", &record, &err_msg));
    CHECK_FALSE(parser.parse("12a4:Jozef:Murgas:Development", &record, &err_msg));
    CHECK_EQ(err_msg, "invalid ID \"12a4\"");

    const UserRecordParser opaque_id_parser;
    CHECK_FALSE(opaque_id_parser.hasIdPattern());
    CHECK_TRUE(opaque_id_parser.parse("x-17:Jozef:Murgas:Development", &record, &err_msg));
}


TEST(blank_lines) {
    CHECK_TRUE(UserRecordParser::IsBlank(""));
    CHECK_TRUE(UserRecordParser::IsBlank(" \t\r"));
    CHECK_FALSE(UserRecordParser::IsBlank(" : "));
}


TEST_MAIN(UserRecordParser)
