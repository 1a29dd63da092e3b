/** \brief Test cases for the LoginNameUtil file pipeline
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
#include <vector>
#include "FileUtil.h"
#include "LoginNameUtil.h"
#include "UnitTest.h"


static void ProcessString(const std::string &contents, const UserRecordParser &parser, LoginNameGenerator * const generator,
                          std::vector<LoginNameUtil::OutputRow> * const output_rows, LoginNameUtil::ProcessingStats * const stats)
{
    const FileUtil::AutoTempFile temp_file("/tmp/LoginNameUtilTests");
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), contents);
    const auto input(FileUtil::OpenInputFileOrDie(temp_file.getFilePath()));
    LoginNameUtil::ProcessFile(input.get(), parser, generator, output_rows, stats);
}


TEST(process_file) {
    const UserRecordParser parser;
    LoginNameGenerator generator;
    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    ProcessString("1234:Jozef:Miloslav:Hurban:Legal\n"
                  "4563:Jozef::Murgas:Development\n"
                  "\n"
                  "1235:Jan:Matej:Hurban:Sales\n",
                  parser, &generator, &output_rows, &stats);

    CHECK_EQ(output_rows.size(), 3u);
    CHECK_EQ(output_rows[0].id_, "1234");
    CHECK_EQ(output_rows[0].login_name_, "jmhurban");
    CHECK_EQ(output_rows[1].id_, "4563");
    CHECK_EQ(output_rows[1].login_name_, "jmurgas");
    CHECK_EQ(output_rows[2].id_, "1235");
    CHECK_EQ(output_rows[2].login_name_, "jmhurban1");

    CHECK_EQ(stats.files_processed_, 1u);
    CHECK_EQ(stats.records_processed_, 3u);
    CHECK_EQ(stats.lines_skipped_, 0u);
}


TEST(malformed_lines_are_skipped) {
    const UserRecordParser parser;
    LoginNameGenerator generator;
    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    ProcessString("1:Ann:Lee:Sales\n"
                  "2:Amy:Lee\n"
                  "garbage\n"
                  "3:Al:Lee:IT\n",
                  parser, &generator, &output_rows, &stats);

    CHECK_EQ(output_rows.size(), 2u);
    CHECK_EQ(output_rows[0].login_name_, "alee");
    CHECK_EQ(output_rows[1].id_, "3");
    CHECK_EQ(output_rows[1].login_name_, "alee1");
    CHECK_EQ(stats.lines_skipped_, 2u);
    CHECK_EQ(stats.records_processed_, 2u);
}


TEST(crlf_and_missing_final_newline) {
    const UserRecordParser parser;
    LoginNameGenerator generator;
    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    ProcessString("1:Ann:Lee:Sales\r\n2:Al:Lee:IT", parser, &generator, &output_rows, &stats);

    CHECK_EQ(output_rows.size(), 2u);
    CHECK_EQ(output_rows[0].record_.department_, "Sales");
    CHECK_EQ(output_rows[1].login_name_, "alee1");
}


TEST(empty_file) {
    const UserRecordParser parser;
    LoginNameGenerator generator;
    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    ProcessString("", parser, &generator, &output_rows, &stats);

    CHECK_TRUE(output_rows.empty());
    CHECK_EQ(stats.files_processed_, 1u);
    CHECK_EQ(stats.lines_skipped_, 0u);
}


TEST(counters_are_shared_between_files) {
    const FileUtil::AutoTempFile temp_file1("/tmp/LoginNameUtilTests"), temp_file2("/tmp/LoginNameUtilTests");
    FileUtil::WriteStringOrDie(temp_file1.getFilePath(), "1:Ann:Lee:Sales\n2:Al:Lee:IT\n");
    FileUtil::WriteStringOrDie(temp_file2.getFilePath(), "3:Amy:Lee:HR\n1:Ann:Lee:Sales\n");

    const UserRecordParser parser;
    LoginNameGenerator generator;
    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    LoginNameUtil::ProcessInputFiles({ temp_file1.getFilePath(), temp_file2.getFilePath() }, parser, &generator,
                                     LoginNameUtil::ABORT_ON_UNREADABLE_FILE, &output_rows, &stats);

    CHECK_EQ(output_rows.size(), 4u);
    CHECK_EQ(output_rows[0].login_name_, "alee");
    CHECK_EQ(output_rows[1].login_name_, "alee1");
    CHECK_EQ(output_rows[2].login_name_, "alee2");
    CHECK_EQ(output_rows[3].id_, "1");
    CHECK_EQ(output_rows[3].login_name_, "alee3");
    CHECK_EQ(stats.files_processed_, 2u);
}


TEST(unreadable_files_can_be_skipped) {
    const FileUtil::AutoTempFile temp_file("/tmp/LoginNameUtilTests");
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), "1:Ann:Lee:Sales\n");

    const UserRecordParser parser;
    LoginNameGenerator generator;
    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    LoginNameUtil::ProcessInputFiles({ "/nonexistent/LoginNameUtilTests.input", "/tmp", temp_file.getFilePath() }, parser,
                                     &generator, LoginNameUtil::SKIP_UNREADABLE_FILES, &output_rows, &stats);

    CHECK_EQ(output_rows.size(), 1u);
    CHECK_EQ(stats.files_skipped_, 2u);
    CHECK_EQ(stats.files_processed_, 1u);
}


TEST(format_output_row) {
    const UserRecord record("1234", "Jozef", "", "Murgas", "Development");
    const LoginNameUtil::OutputRow row(record, "jmurgas");
    CHECK_EQ(LoginNameUtil::FormatOutputRow(row, LoginNameConfig::IDS_ONLY), "1234:jmurgas");
    CHECK_EQ(LoginNameUtil::FormatOutputRow(row, LoginNameConfig::FULL_RECORDS), "1234:jmurgas:Jozef::Murgas:Development");
}


TEST(write_output_rows) {
    std::vector<LoginNameUtil::OutputRow> output_rows;
    output_rows.emplace_back(UserRecord("1234", "Jozef", "Miloslav", "Hurban", "Legal"), "jmhurban");
    output_rows.emplace_back(UserRecord("4563", "Jozef", "", "Murgas", "Development"), "jmurgas");

    const FileUtil::AutoTempFile temp_file("/tmp/LoginNameUtilTests");
    {
        const auto output(FileUtil::OpenOutputFileOrDie(temp_file.getFilePath()));
        LoginNameUtil::WriteOutputRows(output.get(), output_rows, LoginNameConfig::IDS_ONLY);
    }
    CHECK_EQ(FileUtil::ReadStringOrDie(temp_file.getFilePath()), "1234:jmhurban\n4563:jmurgas\n");

    {
        const auto output(FileUtil::OpenOutputFileOrDie(temp_file.getFilePath()));
        LoginNameUtil::WriteOutputRows(output.get(), output_rows, LoginNameConfig::FULL_RECORDS);
    }
    CHECK_EQ(FileUtil::ReadStringOrDie(temp_file.getFilePath()),
             "1234:jmhurban:Jozef:Miloslav:Hurban:Legal\n4563:jmurgas:Jozef::Murgas:Development\n");
}


TEST_MAIN(LoginNameUtil)
