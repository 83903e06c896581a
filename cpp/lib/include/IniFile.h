/** \file   IniFile.h
 *  \brief  Declaration of class IniFile, a reader for configuration files in the INI format.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <algorithm>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Reads "name = value" settings grouped into "[section]"s.
 *
 *  Comments start with '#' or ';' and run to the end of the line unless the character is part of a double-quoted
 *  value.  A trailing backslash continues a line.  Double-quoted values may contain the escapes \", \\, \n and \t.
 *  Entries that precede the first section header belong to a section with an empty name.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;
    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;
    public:
        typedef std::vector<Entry>::const_iterator const_iterator;
    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }
        inline const std::string &getSectionName() const { return section_name_; }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }
        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }

        /** \throws std::runtime_error if "variable_name" is already defined in this section. */
        void insert(const std::string &variable_name, const std::string &value);

        /** \brief   Retrieves a string value.
         *  \throws  std::runtime_error if the variable is not found.
         */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws  std::runtime_error if the variable is not found or its value is not exactly one character long. */
        char getChar(const std::string &variable_name) const;
        char getChar(const std::string &variable_name, const char default_value) const;

        /** \throws  std::runtime_error if the variable is not found or the value cannot be converted to an unsigned number. */
        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \brief   Retrieves a boolean value.
         *  \note    Accepted values are, case insensitively, "true", "yes", "on", "false", "no" and "off".  Anything else
         *           results in a std::runtime_error.
         */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

        // \return The names of all entries in the order in which they were defined.
        std::vector<std::string> getEntryNames() const;
    };

    typedef std::vector<Section>::const_iterator const_iterator;
private:
    std::vector<Section> sections_;
    std::string ini_file_name_;
    unsigned current_lineno_;
public:
    /** \brief  Construct an IniFile based on the named file.
     *  \throws std::runtime_error if the file can't be read or contains a syntax error.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const std::string &getFilename() const { return ini_file_name_; }
    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    // \return The named section or nullptr if no such section exists.
    const Section *getSection(const std::string &section_name) const;
    inline bool hasSection(const std::string &section_name) const { return getSection(section_name) != nullptr; }

    // The following accessors return "default_value" if either the section or the variable is missing.
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    char getChar(const std::string &section_name, const std::string &variable_name, const char default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;
private:
    void processFile();
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
    [[noreturn]] void throwSyntaxError(const std::string &function_name, const std::string &problem) const;
};
