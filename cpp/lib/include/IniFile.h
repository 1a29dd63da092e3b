/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
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
#pragma once


#include <algorithm>
#include <map>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the lookup and get* methods.  String constants can use
 *  C-style character backslash escapes like \\n.  If you want to embed a hash mark in a string you must preceede it with
 *  a single backslash.  In order to extend a string constant over multiple lines, put backslashes just before the line
 *  ends on all but the last line.
 *  Malformed files result in a std::runtime_error being thrown by the constructor.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
        inline bool empty() const { return name_.empty() and value_.empty() and comment_.empty(); }
    };

public:
    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        enum DupeInsertionBehaviour { OVERWRITE_EXISTING_VALUE, ABORT_ON_DUPLICATE_NAME };
        typedef std::vector<Entry>::const_iterator const_iterator;
        typedef std::vector<Entry>::iterator iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }
        Section() = default;
        Section(const Section &other) = default;

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        /** \throws  A std::runtime_error if "variable_name" already exists and "dupe_insertion_behaviour" is
         *           ABORT_ON_DUPLICATE_NAME.
         */
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "",
                    const DupeInsertionBehaviour dupe_insertion_behaviour = ABORT_ON_DUPLICATE_NAME);

        void replace(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \brief   Retrieves a string value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \return  The value of the string in the specified section.
         *  \throws  A std::runtime_error if the variable is not found.
         */
        std::string getString(const std::string &variable_name) const;

        /** \brief   Retrieves a string value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \return  The value of the specified variable in the specified section, or "default_value" if it is not
         *           defined.
         */
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves a single character value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \return  The value of the specified variable in the specified section, or "default_value" if it is not
         *           defined.
         *  \throws  A std::runtime_error if the value is not exactly one character long.
         */
        char getChar(const std::string &variable_name, const char default_value) const;

        /** \brief   Retrieves an unsigned value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \return  The value of the specified variable in the specified section, or "default_value" if it is not
         *           defined.
         *  \throws  A std::runtime_error if the value can't be converted to an unsigned.
         */
        unsigned getUnsigned(const std::string &variable_name, const unsigned &default_value) const;

        /** \brief   Retrieves an enum value from a configuration file.
         *  \param   variable_name        The name of the section entry to read.
         *  \param   string_to_value_map  A mapping of allowable string constants in the config file,
         *                                to integer values.
         *  \param   default_value        A default to return if the variable is not defined.
         *  \return  The integer corresponding to the numeric value of the string constant found in the IniFile and
         *           specified via "string_to_value_map" or the default value if no entry has been found.
         *  \note    The expected values for the variable are case sensitive.  The caller will have to use a
         *           static_cast to convert the int-encoded enum to a variable of the approriate enumumerated
         *           type.  Any unknown value results in an exception being thrown.
         */
        int getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                    const int default_value) const;

        std::vector<std::string> getEntryNames() const;

        inline size_t size() const { return entries_.size(); }

        // \return An iterator referencing the found entry or end() if no matching enmtry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        // \return An iterator referencing the found entry or end() if no matching enmtry was found.
        inline iterator find(const std::string &variable_name) {
            return std::find_if(entries_.begin(), entries_.end(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

public:
    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    std::string current_section_name_;
    unsigned current_lineno_;

public:
    /** \brief  Construct an IniFile based on the named file.
     *  \param  ini_file_name  The name of the .ini file.
     *  \throws A std::runtime_error if the file can't be read or is malformed.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.begin(); }
    inline const_iterator end() const { return sections_.end(); }

    /** \brief   Get the name of the file used to construct the object.
     *  \return  The file name.
     */
    const std::string &getFilename() const { return ini_file_name_; }

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    /** \return The names of all sections in the order in which they were defined.  Entries that precede the first
     *          section header end up in a section named "". */
    std::vector<std::string> getSections() const;

    bool sectionIsDefined(const std::string &section_name) const;

    // \return end() if the section doesn't exist.
    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }

private:
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
    void processFile(const std::string &filename);
    std::string locationForMessages() const;
};
