/** \file   LoginNameConfig.cc
 *  \brief  Configuration of the login name generator as read from an IniFile.
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
#include "LoginNameConfig.h"
#include <stdexcept>
#include "LoginNameGenerator.h"
#include "RegexMatcher.h"
#include "UserRecord.h"


namespace LoginNameConfig {


const std::map<std::string, int> STRING_TO_OUTPUT_FORMAT_MAP{
    { "ids", IDS_ONLY },
    { "full", FULL_RECORDS },
};


const std::map<GeneratorParams::IniKey, std::string> GeneratorParams::KEY_TO_STRING_MAP{
    { MAX_BASE_LENGTH, "max_base_length" },
    { FIELD_SEPARATOR, "field_separator" },
    { ID_PATTERN, "id_pattern" },
};


std::string GeneratorParams::GetIniKeyString(const IniKey ini_key) {
    const auto key_and_string(KEY_TO_STRING_MAP.find(ini_key));
    if (key_and_string == KEY_TO_STRING_MAP.end())
        LOG_ERROR("invalid GeneratorParams INI key '" + std::to_string(ini_key) + "'");
    return key_and_string->second;
}


GeneratorParams::GeneratorParams()
    : max_base_length_(LoginNameGenerator::DEFAULT_MAX_BASE_LENGTH), field_separator_(UserRecordParser::DEFAULT_FIELD_SEPARATOR) { }


GeneratorParams::GeneratorParams(const IniFile::Section &config_section): GeneratorParams() {
    max_base_length_ = config_section.getUnsigned(GetIniKeyString(MAX_BASE_LENGTH), max_base_length_);
    if (max_base_length_ == 0)
        throw std::runtime_error("in LoginNameConfig::GeneratorParams::GeneratorParams: \"" + GetIniKeyString(MAX_BASE_LENGTH)
                                 + "\" must be at least 1!");

    field_separator_ = config_section.getChar(GetIniKeyString(FIELD_SEPARATOR), field_separator_);
    if (field_separator_ == '\n' or field_separator_ == '\r')
        throw std::runtime_error("in LoginNameConfig::GeneratorParams::GeneratorParams: \"" + GetIniKeyString(FIELD_SEPARATOR)
                                 + "\" must not be a line end!");

    id_pattern_ = config_section.getString(GetIniKeyString(ID_PATTERN), "");
    std::string err_msg;
    if (not id_pattern_.empty() and not ThreadSafeRegexMatcher::IsValid(id_pattern_, &err_msg))
        throw std::runtime_error("in LoginNameConfig::GeneratorParams::GeneratorParams: bad \"" + GetIniKeyString(ID_PATTERN)
                                 + "\": " + err_msg);

    CheckIniSection(config_section, GeneratorParams::KEY_TO_STRING_MAP);
}


const std::map<OutputParams::IniKey, std::string> OutputParams::KEY_TO_STRING_MAP{
    { OUTPUT_FORMAT, "output_format" },
};


std::string OutputParams::GetIniKeyString(const IniKey ini_key) {
    const auto key_and_string(KEY_TO_STRING_MAP.find(ini_key));
    if (key_and_string == KEY_TO_STRING_MAP.end())
        LOG_ERROR("invalid OutputParams INI key '" + std::to_string(ini_key) + "'");
    return key_and_string->second;
}


OutputParams::OutputParams(const IniFile::Section &config_section): OutputParams() {
    output_format_ = static_cast<OutputFormat>(
        config_section.getEnum(GetIniKeyString(OUTPUT_FORMAT), STRING_TO_OUTPUT_FORMAT_MAP, output_format_));

    CheckIniSection(config_section, OutputParams::KEY_TO_STRING_MAP);
}


void LoadFromFile(const std::string &config_path, GeneratorParams * const generator_params, OutputParams * const output_params) {
    const IniFile ini_file(config_path);

    for (const auto &section : ini_file) {
        if (section.getSectionName() == GENERATOR_SECTION)
            *generator_params = GeneratorParams(section);
        else if (section.getSectionName() == OUTPUT_SECTION)
            *output_params = OutputParams(section);
        else if (not section.getSectionName().empty() or not section.getEntryNames().empty())
            LOG_WARNING("ignoring unknown section \"" + section.getSectionName() + "\" in \"" + config_path + "\"");
    }

    LOG_DEBUG("loaded \"" + config_path + "\": max_base_length=" + std::to_string(generator_params->max_base_length_)
              + ", field_separator='" + std::string(1, generator_params->field_separator_) + "', id_pattern=\""
              + generator_params->id_pattern_ + "\"");
}


} // namespace LoginNameConfig
