/** \file   LoginNameUtil.h
 *  \brief  Reading user record files and writing login name assignments.
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
#include <vector>
#include "File.h"
#include "LoginNameConfig.h"
#include "LoginNameGenerator.h"
#include "UserRecord.h"


namespace LoginNameUtil {


const char OUTPUT_FIELD_SEPARATOR(':');


struct OutputRow {
    std::string id_;
    std::string login_name_;
    UserRecord record_;

public:
    OutputRow(const UserRecord &record, const std::string &login_name): id_(record.id_), login_name_(login_name), record_(record) { }
};


struct ProcessingStats {
    unsigned files_processed_;
    unsigned files_skipped_;
    unsigned records_processed_;
    unsigned lines_skipped_;

public:
    ProcessingStats(): files_processed_(0), files_skipped_(0), records_processed_(0), lines_skipped_(0) { }
    std::string toString() const;
};


enum UnreadableFileBehaviour { ABORT_ON_UNREADABLE_FILE, SKIP_UNREADABLE_FILES };


/** \brief  Reads all records from "input" and appends a row for each valid record to "output_rows".
 *  \note   Blank lines are silently ignored.  Malformed lines are reported as warnings, counted in
 *          "stats->lines_skipped_" and leave the generator untouched.
 */
void ProcessFile(File * const input, const UserRecordParser &parser, LoginNameGenerator * const generator,
                 std::vector<OutputRow> * const output_rows, ProcessingStats * const stats);


/** \brief  Processes "input_filenames" in order, sharing "generator" between all files.
 *  \note   All files are checked before anything is processed.  Depending on "unreadable_file_behaviour" we either
 *          abort or warn about and skip files that can't be read.
 */
void ProcessInputFiles(const std::vector<std::string> &input_filenames, const UserRecordParser &parser,
                       LoginNameGenerator * const generator, const UnreadableFileBehaviour unreadable_file_behaviour,
                       std::vector<OutputRow> * const output_rows, ProcessingStats * const stats);


// \return The output line for "row", without a terminating newline.
std::string FormatOutputRow(const OutputRow &row, const LoginNameConfig::OutputFormat output_format);


/** \brief Writes one line per row to "output".  Aborts on write errors. */
void WriteOutputRows(File * const output, const std::vector<OutputRow> &output_rows, const LoginNameConfig::OutputFormat output_format);


} // namespace LoginNameUtil
