/** \file   LoginNameUtil.cc
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
#include "LoginNameUtil.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace LoginNameUtil {


std::string ProcessingStats::toString() const {
    return "processed " + std::to_string(records_processed_) + " record(s) from " + std::to_string(files_processed_)
           + " file(s), skipped " + std::to_string(lines_skipped_) + " line(s) and " + std::to_string(files_skipped_) + " file(s)";
}


void ProcessFile(File * const input, const UserRecordParser &parser, LoginNameGenerator * const generator,
                 std::vector<OutputRow> * const output_rows, ProcessingStats * const stats)
{
    unsigned line_no(0);
    std::string line, err_msg;
    UserRecord record;
    while (not input->eof()) {
        input->getline(&line);
        ++line_no;

        if (UserRecordParser::IsBlank(line))
            continue;

        if (not parser.parse(line, &record, &err_msg)) {
            LOG_WARNING("skipping line " + std::to_string(line_no) + " in \"" + input->getPath() + "\": " + err_msg);
            ++stats->lines_skipped_;
            continue;
        }

        output_rows->emplace_back(record, generator->generate(record));
        ++stats->records_processed_;
    }

    if (unlikely(input->anErrorOccurred()))
        LOG_ERROR("an error occurred while reading \"" + input->getPath() + "\"!");

    ++stats->files_processed_;
}


void ProcessInputFiles(const std::vector<std::string> &input_filenames, const UserRecordParser &parser,
                       LoginNameGenerator * const generator, const UnreadableFileBehaviour unreadable_file_behaviour,
                       std::vector<OutputRow> * const output_rows, ProcessingStats * const stats)
{
    std::vector<std::string> readable_filenames;
    for (const auto &input_filename : input_filenames) {
        std::string error_message;
        if (FileUtil::IsDirectory(input_filename))
            error_message = "is a directory";
        else if (FileUtil::IsReadable(input_filename, &error_message)) {
            readable_filenames.emplace_back(input_filename);
            continue;
        }

        if (unreadable_file_behaviour == ABORT_ON_UNREADABLE_FILE)
            LOG_ERROR("can't read \"" + input_filename + "\": " + error_message);
        LOG_WARNING("skipping unreadable file \"" + input_filename + "\": " + error_message);
        ++stats->files_skipped_;
    }

    for (const auto &input_filename : readable_filenames) {
        LOG_INFO("processing \"" + input_filename + "\"");
        const auto input(FileUtil::OpenInputFileOrDie(input_filename));
        ProcessFile(input.get(), parser, generator, output_rows, stats);
    }
}


std::string FormatOutputRow(const OutputRow &row, const LoginNameConfig::OutputFormat output_format) {
    std::vector<std::string> fields{ row.id_, row.login_name_ };
    if (output_format == LoginNameConfig::FULL_RECORDS) {
        fields.emplace_back(row.record_.forename_);
        fields.emplace_back(row.record_.middle_name_);
        fields.emplace_back(row.record_.surname_);
        fields.emplace_back(row.record_.department_);
    }

    return StringUtil::Join(fields, OUTPUT_FIELD_SEPARATOR);
}


void WriteOutputRows(File * const output, const std::vector<OutputRow> &output_rows, const LoginNameConfig::OutputFormat output_format) {
    for (const auto &row : output_rows) {
        if (unlikely(not output->writeln(FormatOutputRow(row, output_format))))
            LOG_ERROR("failed to write to \"" + output->getPath() + "\"!");
    }
}


} // namespace LoginNameUtil
