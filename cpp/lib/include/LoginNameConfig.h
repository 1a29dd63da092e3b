/** \file   LoginNameConfig.h
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
#pragma once


#include <map>
#include <string>
#include "IniFile.h"
#include "util.h"


// This namespace contains classes that represent the (immutable) configuration data of the login name generator.
// Refer to the documentation in the sample configuration file generate_login_names.conf for details about
// individual configuration keys.
namespace LoginNameConfig {


const std::string GENERATOR_SECTION("Generator");
const std::string OUTPUT_SECTION("Output");


enum OutputFormat : int { IDS_ONLY, FULL_RECORDS };


extern const std::map<std::string, int> STRING_TO_OUTPUT_FORMAT_MAP;


// Parameters that control how records are parsed and how login names are derived from them.
struct GeneratorParams {
    enum IniKey : unsigned { MAX_BASE_LENGTH, FIELD_SEPARATOR, ID_PATTERN };

    unsigned max_base_length_;
    char field_separator_;
    std::string id_pattern_; // Empty if IDs are not being checked.

public:
    GeneratorParams();

    /** \throws std::runtime_error if an entry has an invalid value. */
    explicit GeneratorParams(const IniFile::Section &config_section);

    static std::string GetIniKeyString(const IniKey ini_key);

private:
    static const std::map<IniKey, std::string> KEY_TO_STRING_MAP;
};


struct OutputParams {
    enum IniKey : unsigned { OUTPUT_FORMAT };

    OutputFormat output_format_;

public:
    OutputParams(): output_format_(IDS_ONLY) { }

    /** \throws std::runtime_error if an entry has an invalid value. */
    explicit OutputParams(const IniFile::Section &config_section);

    static std::string GetIniKeyString(const IniKey ini_key);

private:
    static const std::map<IniKey, std::string> KEY_TO_STRING_MAP;
};


/** \brief  Reads the "Generator" and "Output" sections from "config_path".  Missing sections or entries keep their
 *          defaults.  Unknown sections and entries result in warnings.
 *  \throws std::runtime_error if the file can't be read, is malformed or contains invalid values.
 */
void LoadFromFile(const std::string &config_path, GeneratorParams * const generator_params, OutputParams * const output_params);


// Warns about entries in "section" whose names aren't values of "allowed_values".
template <typename EnumType>
void CheckIniSection(const IniFile::Section &section, const std::map<EnumType, std::string> &allowed_values) {
    for (const auto &entry : section) {
        if (entry.name_.empty())
            continue;

        bool valid(false);
        for (const auto &allowed_value : allowed_values) {
            if (entry.name_ == allowed_value.second) {
                valid = true;
                break;
            }
        }

        if (not valid) {
            std::string message("Invalid ini entry \"" + entry.name_ + "\"");
            if (not section.getSectionName().empty())
                message += " in section \"" + section.getSectionName() + "\"";
            LOG_WARNING(message);
        }
    }
}


} // namespace LoginNameConfig
