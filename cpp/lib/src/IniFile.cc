/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "IniFile.h"
#include <memory>
#include <stdexcept>
#include "File.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment,
                              const DupeInsertionBehaviour dupe_insertion_behaviour) {
    // Handle comment-only lines first:
    if (variable_name.empty() and value.empty()) {
        entries_.emplace_back("", "", comment);
        return;
    }

    const bool variable_is_defined(find(variable_name) != end());
    if (dupe_insertion_behaviour == ABORT_ON_DUPLICATE_NAME and unlikely(variable_is_defined))
        throw std::runtime_error("in IniFile::Section::insert: duplicate variable name \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    replace(variable_name, value, comment);
}


void IniFile::Section::replace(const std::string &variable_name, const std::string &value, const std::string &comment) {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value, comment);
    else {
        existing_entry->value_ = value;
        existing_entry->comment_ = comment;
    }
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    return existing_entry->value_;
}


char IniFile::Section::getChar(const std::string &variable_name, const char default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    if (existing_entry->value_.length() != 1)
        throw std::runtime_error("invalid character variable value \"" + variable_name + "\" in section \"" + section_name_
                                 + "\" (must be exactly one character in length)!");

    return existing_entry->value_[0];
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned &default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        throw std::runtime_error("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


int IniFile::Section::getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                              const int default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    const auto name_and_int_value(string_to_value_map.find(existing_entry->value_));
    if (name_and_int_value == string_to_value_map.end())
        throw std::runtime_error("in section \"" + section_name_ + "\": invalid enum value \"" + existing_entry->value_
                                 + "\" for entry \"" + variable_name + "\"!");

    return name_and_int_value->second;
}


std::vector<std::string> IniFile::Section::getEntryNames() const {
    std::vector<std::string> entry_names;

    for (const auto &entry : entries_) {
        if (not entry.name_.empty())
            entry_names.emplace_back(entry.name_);
    }

    return entry_names;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    processFile(ini_file_name_);
}


std::string IniFile::locationForMessages() const {
    return "on line " + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header " + locationForMessages() + "!");

    current_section_name_ = line.substr(1, line.length() - 2);
    StringUtil::Trim(" \t", &current_section_name_);
    if (current_section_name_.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name " + locationForMessages() + "!");

    if (sectionIsDefined(current_section_name_))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + current_section_name_ + "\" "
                                 + locationForMessages() + "!");
    sections_.emplace_back(current_section_name_);
}


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens and underscores.
//
static bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    std::string::const_iterator ch(possible_variable_name.begin());

    // Variable names must start with a letter...
    if (not StringUtil::IsAsciiLetter(*ch))
        return false;

    // ...followed by letters, digits, hyphens, underscores or periods:
    for (++ch; ch != possible_variable_name.end(); ++ch) {
        if (not StringUtil::IsAlphanumeric(*ch) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // Not a normal "variable = value" type line.
        const std::string trimmed_line(StringUtil::Trim(" \t", line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" "
                                     + locationForMessages() + "!");

        sections_.back().insert(trimmed_line, "true", comment);
        return;
    }

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (variable_name.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable name " + locationForMessages() + "!");

    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" "
                                 + locationForMessages() + "!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value " + locationForMessages() + "!");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value " + locationForMessages() + "!");

        value = value.substr(1, value.length() - 2);
        try {
            value = StringUtil::CStyleUnescape(value);
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape " + locationForMessages() + "! ("
                                     + std::string(x.what()) + ")");
        }
    }

    sections_.back().insert(variable_name, value, comment);
}


static std::string StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    size_t comment_start_pos(0);
    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '\"')
            inside_string_literal = inside_string_literal == false;
        else if (*character == '#') {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            else if (inside_string_literal)
                continue;
            else {
                comment_start_pos = std::distance(line->begin(), character);
                while (comment_start_pos > 0 and (*line)[comment_start_pos - 1] == ' ')
                    --comment_start_pos;
                *comment = line->substr(comment_start_pos);
                line->resize(comment_start_pos);
                return *line;
            }
        }
    }

    return *line;
}


void IniFile::processFile(const std::string &filename) {
    std::string error_message;
    if (unlikely(not FileUtil::IsReadable(filename, &error_message)))
        throw std::runtime_error("in IniFile::processFile: " + error_message);
    if (unlikely(FileUtil::IsDirectory(filename)))
        throw std::runtime_error("in IniFile::processFile: \"" + filename + "\" is a directory!");

    const std::unique_ptr<File> ini_file(FileUtil::OpenInputFileOrDie(filename));
    while (not ini_file->eof()) {
        // Read lines until the newline character is not preceeded by a '\':
        std::string line;
        for (;;) {
            std::string buf(ini_file->getline());
            ++current_lineno_;
            StringUtil::RightTrim(&buf, '\r');
            line += StringUtil::Trim(" \t", buf);
            if (line.empty() or line[line.length() - 1] != '\\' or ini_file->eof())
                break;
            line = StringUtil::Trim(" \t", line.substr(0, line.length() - 1));
        }

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty()) {
            if (sections_.empty())
                sections_.emplace_back(Section(""));
            sections_.back().insert("", "", comment);
            continue;
        }

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back(Section(""));
            processSectionEntry(line, comment);
        }
    }
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend()) {
        s->clear();
        return false;
    }

    return section->lookup(variable_name, s);
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.getSectionName());

    return section_names;
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend();
}
