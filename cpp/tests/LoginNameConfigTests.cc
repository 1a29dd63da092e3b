/** \brief Test cases for LoginNameConfig
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
#include <stdexcept>
#include <string>
#include "FileUtil.h"
#include "LoginNameConfig.h"
#include "UnitTest.h"


// Loads "contents" as a config file into "generator_params" and "output_params".
static void LoadFromString(const std::string &contents, LoginNameConfig::GeneratorParams * const generator_params,
                           LoginNameConfig::OutputParams * const output_params)
{
    const FileUtil::AutoTempFile temp_file("/tmp/LoginNameConfigTests", ".conf");
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), contents);
    LoginNameConfig::LoadFromFile(temp_file.getFilePath(), generator_params, output_params);
}


static bool LoadFromStringFails(const std::string &contents) {
    LoginNameConfig::GeneratorParams generator_params;
    LoginNameConfig::OutputParams output_params;
    try {
        LoadFromString(contents, &generator_params, &output_params);
    } catch (const std::runtime_error &x) {
        std::cerr << "\texpected error: " << x.what() << '\n';
        return true;
    }

    return false;
}


TEST(defaults) {
    const LoginNameConfig::GeneratorParams generator_params;
    CHECK_EQ(generator_params.max_base_length_, 8u);
    CHECK_EQ(generator_params.field_separator_, ':');
    CHECK_TRUE(generator_params.id_pattern_.empty());

    const LoginNameConfig::OutputParams output_params;
    CHECK_EQ(output_params.output_format_, LoginNameConfig::IDS_ONLY);
}


TEST(ini_key_strings) {
    using LoginNameConfig::GeneratorParams;
    CHECK_EQ(GeneratorParams::GetIniKeyString(GeneratorParams::MAX_BASE_LENGTH), "max_base_length");
    CHECK_EQ(GeneratorParams::GetIniKeyString(GeneratorParams::FIELD_SEPARATOR), "field_separator");
    CHECK_EQ(GeneratorParams::GetIniKeyString(GeneratorParams::ID_PATTERN), "id_pattern");
    CHECK_EQ(LoginNameConfig::OutputParams::GetIniKeyString(LoginNameConfig::OutputParams::OUTPUT_FORMAT), "output_format");
}


TEST(load_complete_file) {
    LoginNameConfig::GeneratorParams generator_params;
    LoginNameConfig::OutputParams output_params;
    LoadFromString("# Test configuration\n"
                   "[Generator]\n"
                   "max_base_length = 6\n"
                   "field_separator = ;\n"
                   "id_pattern = \"^[0-9]+$\"\n"
                   "\n"
                   "[Output]\n"
                   "output_format = full # the extended format\n",
                   &generator_params, &output_params);

    CHECK_EQ(generator_params.max_base_length_, 6u);
    CHECK_EQ(generator_params.field_separator_, ';');
    CHECK_EQ(generator_params.id_pattern_, "^[0-9]+$");
    CHECK_EQ(output_params.output_format_, LoginNameConfig::FULL_RECORDS);
}


TEST(missing_entries_keep_their_defaults) {
    LoginNameConfig::GeneratorParams generator_params;
    LoginNameConfig::OutputParams output_params;
    LoadFromString("[Generator]\n"
                   "max_base_length = 10\n",
                   &generator_params, &output_params);

    CHECK_EQ(generator_params.max_base_length_, 10u);
    CHECK_EQ(generator_params.field_separator_, ':');
    CHECK_TRUE(generator_params.id_pattern_.empty());
    CHECK_EQ(output_params.output_format_, LoginNameConfig::IDS_ONLY);
}


TEST(unknown_sections_and_entries_are_tolerated) {
    LoginNameConfig::GeneratorParams generator_params;
    LoginNameConfig::OutputParams output_params;
    LoadFromString("[Generator]\n"
                   "max_base_length = 7\n"
                   "colour = blue\n"
                   "[Elsewhere]\n"
                   "x = 1\n",
                   &generator_params, &output_params);

    CHECK_EQ(generator_params.max_base_length_, 7u);
}


TEST(invalid_values) {
    CHECK_TRUE(LoadFromStringFails("[Generator]\nmax_base_length = 0\n"));
    CHECK_TRUE(LoadFromStringFails("[Generator]\nmax_base_length = eight\n"));
    CHECK_TRUE(LoadFromStringFails("[Generator]\nfield_separator = ::\n"));
    CHECK_TRUE(LoadFromStringFails("[Generator]\nfield_separator = \"\\n\"\n"));
    CHECK_TRUE(LoadFromStringFails("[Generator]\nid_pattern = \"[0-9\"\n"));
    CHECK_TRUE(LoadFromStringFails("[Output]\noutput_format = xml\n"));
}


TEST(malformed_files) {
    CHECK_TRUE(LoadFromStringFails("[Generator\nmax_base_length = 8\n"));
    CHECK_TRUE(LoadFromStringFails("[Generator]\nmax_base_length = 8\nmax_base_length = 9\n"));

    LoginNameConfig::GeneratorParams generator_params;
    LoginNameConfig::OutputParams output_params;
    CHECK_THROWS(LoginNameConfig::LoadFromFile("/nonexistent/generate_login_names.conf", &generator_params, &output_params),
                 std::runtime_error);
}


TEST_MAIN(LoginNameConfig)
