/** \brief Test cases for IniFile
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
#include <map>
#include <stdexcept>
#include <string>
#include "FileUtil.h"
#include "IniFile.h"
#include "UnitTest.h"


static const std::string INI_CONTENTS(
    "# A comment.\n"
    "global = yes\n"
    "\n"
    "[Generator]\n"
    "max_base_length = 12 # trailing comment\n"
    "separator = \"\\x3B\"\n"
    "pattern = ^[0-9] \\\n"
    "          +$\r\n"
    "flag\n"
    "\n"
    "[Output]\n"
    "output_format = full\n");


TEST(sections) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), INI_CONTENTS);
    const IniFile ini_file(temp_file.getFilePath());

    CHECK_EQ(ini_file.getFilename(), temp_file.getFilePath());
    CHECK_TRUE(ini_file.sectionIsDefined(""));
    CHECK_TRUE(ini_file.sectionIsDefined("Generator"));
    CHECK_TRUE(ini_file.sectionIsDefined("Output"));
    CHECK_FALSE(ini_file.sectionIsDefined("Input"));
    CHECK_EQ(ini_file.getSections().size(), 3u);

    std::string value;
    CHECK_TRUE(ini_file.lookup("", "global", &value));
    CHECK_EQ(value, "yes");
    CHECK_FALSE(ini_file.lookup("Input", "global", &value));
}


TEST(section_getters) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");
    FileUtil::WriteStringOrDie(temp_file.getFilePath(), INI_CONTENTS);
    const IniFile ini_file(temp_file.getFilePath());

    const auto section(ini_file.getSection("Generator"));
    CHECK_TRUE(section != ini_file.end());
    CHECK_EQ(section->getUnsigned("max_base_length", 8), 12u);
    CHECK_EQ(section->getUnsigned("no_such_entry", 8), 8u);
    CHECK_EQ(section->getChar("separator", ':'), ';');
    CHECK_EQ(section->getString("pattern"), "^[0-9]+$");
    CHECK_EQ(section->getString("flag"), "true");
    CHECK_EQ(section->getString("no_such_entry", "default"), "default");
    CHECK_THROWS(section->getString("no_such_entry"), std::runtime_error);
    CHECK_THROWS(section->getChar("pattern", ':'), std::runtime_error);
    CHECK_EQ(section->getEntryNames().size(), 4u);

    const std::map<std::string, int> formats{ { "ids", 0 }, { "full", 1 } };
    const auto output_section(ini_file.getSection("Output"));
    CHECK_EQ(output_section->getEnum("output_format", formats, 0), 1);
    CHECK_EQ(output_section->getEnum("no_such_entry", formats, 0), 0);
}


TEST(malformed_files) {
    const FileUtil::AutoTempFile temp_file("/tmp/IniFileTests", ".conf");

    FileUtil::WriteStringOrDie(temp_file.getFilePath(), "[]\n");
    CHECK_THROWS(IniFile(temp_file.getFilePath()), std::runtime_error);

    FileUtil::WriteStringOrDie(temp_file.getFilePath(), "[A]\n1abc = x\n");
    CHECK_THROWS(IniFile(temp_file.getFilePath()), std::runtime_error);

    FileUtil::WriteStringOrDie(temp_file.getFilePath(), "[A]\nname = \"unterminated\n");
    CHECK_THROWS(IniFile(temp_file.getFilePath()), std::runtime_error);

    FileUtil::WriteStringOrDie(temp_file.getFilePath(), "[A]\nname =\n");
    CHECK_THROWS(IniFile(temp_file.getFilePath()), std::runtime_error);

    CHECK_THROWS(IniFile("/nonexistent/IniFileTests.conf"), std::runtime_error);
}


TEST_MAIN(IniFile)
