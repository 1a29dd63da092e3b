/** \file   generate_login_names.cc
 *  \brief  Assigns unique login names to people listed in colon-separated user record files.
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
#include <cstdlib>
#include <cstring>
#include "FileUtil.h"
#include "LoginNameConfig.h"
#include "LoginNameGenerator.h"
#include "LoginNameUtil.h"
#include "StringUtil.h"
#include "UserRecord.h"
#include "util.h"


namespace {


[[noreturn]] void Usage(const int exit_code = EXIT_FAILURE) {
    ::Usage("[--config-file=path] [--full-records] [--skip-unreadable-files] (-o|--output) output_file\n"
            "input_file1 [input_file2 .. input_fileN]\n"
            "Each input line has the form ID:Forename[:Middlename]:Surname:Department and each output line\n"
            "the form ID:login_name.  With --full-records the output lines are\n"
            "ID:login_name:Forename:Middlename:Surname:Department instead.\n"
            "Options may also follow the input files.\n"
            "Malformed input lines are reported and skipped.  Unreadable input files are fatal unless\n"
            "--skip-unreadable-files has been specified.",
            exit_code);
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_path, output_path;
    bool full_records(false);
    auto unreadable_file_behaviour(LoginNameUtil::ABORT_ON_UNREADABLE_FILE);
    std::vector<std::string> input_filenames;
    for (int arg_no(1); arg_no < argc; ++arg_no) {
        const char * const arg(argv[arg_no]);
        if (std::strcmp(arg, "-h") == 0 or std::strcmp(arg, "--help") == 0)
            Usage(EXIT_SUCCESS);
        else if (StringUtil::StartsWith(arg, "--config-file="))
            config_path = arg + std::strlen("--config-file=");
        else if (std::strcmp(arg, "--full-records") == 0)
            full_records = true;
        else if (std::strcmp(arg, "--skip-unreadable-files") == 0)
            unreadable_file_behaviour = LoginNameUtil::SKIP_UNREADABLE_FILES;
        else if (std::strcmp(arg, "-o") == 0 or std::strcmp(arg, "--output") == 0) {
            if (arg_no + 1 == argc)
                Usage();
            output_path = argv[++arg_no];
        } else if (StringUtil::StartsWith(arg, "--output="))
            output_path = arg + std::strlen("--output=");
        else if (arg[0] == '-')
            Usage();
        else
            input_filenames.emplace_back(arg);
    }

    if (output_path.empty()) {
        LOG_WARNING("missing output file!");
        Usage();
    }
    if (input_filenames.empty()) {
        LOG_WARNING("no input files!");
        Usage();
    }

    LoginNameConfig::GeneratorParams generator_params;
    LoginNameConfig::OutputParams output_params;
    if (not config_path.empty())
        LoginNameConfig::LoadFromFile(config_path, &generator_params, &output_params);
    if (full_records)
        output_params.output_format_ = LoginNameConfig::FULL_RECORDS;

    const UserRecordParser parser(generator_params.field_separator_, generator_params.id_pattern_);
    LoginNameGenerator generator(generator_params.max_base_length_);

    std::vector<LoginNameUtil::OutputRow> output_rows;
    LoginNameUtil::ProcessingStats stats;
    LoginNameUtil::ProcessInputFiles(input_filenames, parser, &generator, unreadable_file_behaviour, &output_rows, &stats);

    const auto output(FileUtil::OpenOutputFileOrDie(output_path));
    LoginNameUtil::WriteOutputRows(output.get(), output_rows, output_params.output_format_);
    if (not output->close())
        LOG_ERROR("failed to close \"" + output_path + "\"!");

    LOG_INFO(stats.toString() + ", wrote " + std::to_string(output_rows.size()) + " login name(s) to \"" + output_path + "\"");

    return EXIT_SUCCESS;
}
