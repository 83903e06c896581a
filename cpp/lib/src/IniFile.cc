/** \file   IniFile.cc
 *  \brief  Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    if (unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: duplicate entry \"" + variable_name + "\" in section \"" + section_name_
                                 + "\"!");
    entries_.emplace_back(variable_name, value);
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("in IniFile::Section::getString: can't find \"" + variable_name + "\" in section \"" + section_name_
                                 + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    return (existing_entry == end()) ? default_value : existing_entry->value_;
}


char IniFile::Section::getChar(const std::string &variable_name) const {
    const std::string value(getString(variable_name));
    if (value.length() != 1)
        throw std::runtime_error("in IniFile::Section::getChar: invalid character variable value \"" + variable_name + "\" in section \""
                                 + section_name_ + "\" (must be exactly one character in length)!");

    return value[0];
}


char IniFile::Section::getChar(const std::string &variable_name, const char default_value) const {
    return hasEntry(variable_name) ? getChar(variable_name) : default_value;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const std::string value(getString(variable_name));
    unsigned number;
    if (not StringUtil::ToUnsigned(value, &number))
        throw std::runtime_error("in IniFile::Section::getUnsigned: invalid unsigned entry \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const std::string value(StringUtil::ASCIIToLower(getString(variable_name)));
    if (value == "true" or value == "yes" or value == "on")
        return true;
    if (value == "false" or value == "no" or value == "off")
        return false;

    throw std::runtime_error("in IniFile::Section::getBool: invalid boolean value in section \"" + section_name_ + "\", entry \""
                             + variable_name + "\" (bad value is \"" + value + "\")!");
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


std::vector<std::string> IniFile::Section::getEntryNames() const {
    std::vector<std::string> entry_names;
    for (const auto &entry : entries_)
        entry_names.emplace_back(entry.name_);
    return entry_names;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    processFile();
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    return (section == sections_.cend()) ? nullptr : &*section;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getString(variable_name, default_value);
}


char IniFile::getChar(const std::string &section_name, const std::string &variable_name, const char default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getChar(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getUnsigned(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getBool(variable_name, default_value);
}


void IniFile::throwSyntaxError(const std::string &function_name, const std::string &problem) const {
    throw std::runtime_error("in IniFile::" + function_name + ": " + problem + " on line " + std::to_string(current_lineno_)
                             + " in file \"" + ini_file_name_ + "\"!");
}


namespace {


// Only allow names that start with a letter followed by letters, digits, hyphens, underscores and periods.
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not ((*ch >= 'a' and *ch <= 'z') or (*ch >= 'A' and *ch <= 'Z')))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not ((*ch >= 'a' and *ch <= 'z') or (*ch >= 'A' and *ch <= 'Z') or StringUtil::IsDigit(*ch)) and *ch != '-' and *ch != '_'
            and *ch != '.')
            return false;
    }

    return true;
}


void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (auto ch(line->begin()); ch != line->end(); ++ch) {
        if (*ch == '"' and (ch == line->begin() or *(ch - 1) != '\\'))
            inside_string_literal = not inside_string_literal;
        else if ((*ch == '#' or *ch == ';') and not inside_string_literal) {
            line->erase(ch, line->end());
            return;
        }
    }
}


bool CStyleUnescape(std::string * const s) {
    std::string unescaped;
    bool backslash_seen(false);
    for (const char ch : *s) {
        if (backslash_seen) {
            switch (ch) {
            case '"':
            case '\\':
                unescaped += ch;
                break;
            case 'n':
                unescaped += '\n';
                break;
            case 't':
                unescaped += '\t';
                break;
            default:
                return false;
            }
            backslash_seen = false;
        } else if (ch == '\\')
            backslash_seen = true;
        else
            unescaped += ch;
    }

    if (backslash_seen)
        return false;

    s->swap(unescaped);
    return true;
}


} // unnamed namespace


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throwSyntaxError("processSectionHeader", "garbled section header");

    const std::string section_name(StringUtil::Trim(line.substr(1, line.length() - 2), " \t"));
    if (section_name.empty())
        throwSyntaxError("processSectionHeader", "empty section name");
    if (hasSection(section_name))
        throwSyntaxError("processSectionHeader", "duplicate section \"" + section_name + "\"");

    sections_.emplace_back(section_name);
}


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) {
        if (unlikely(not IsValidVariableName(line)))
            throwSyntaxError("processSectionEntry", "invalid variable name \"" + line + "\"");
        sections_.back().insert(line, "true");
        return;
    }

    const std::string variable_name(StringUtil::Trim(line.substr(0, equal_sign), " \t"));
    if (variable_name.empty())
        throwSyntaxError("processSectionEntry", "missing variable name");
    if (not IsValidVariableName(variable_name))
        throwSyntaxError("processSectionEntry", "invalid variable name \"" + variable_name + "\"");

    std::string value(StringUtil::Trim(line.substr(equal_sign + 1), " \t"));
    if (value.empty())
        throwSyntaxError("processSectionEntry", "missing variable value");

    if (value[0] == '"') {
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throwSyntaxError("processSectionEntry", "improperly quoted value");
        value = value.substr(1, value.length() - 2);
        if (not CStyleUnescape(&value))
            throwSyntaxError("processSectionEntry", "bad escape");
    }

    if (unlikely(sections_.back().hasEntry(variable_name)))
        throwSyntaxError("processSectionEntry", "duplicate entry \"" + variable_name + "\"");
    sections_.back().insert(variable_name, value);
}


void IniFile::processFile() {
    if (unlikely(not FileUtil::Exists(ini_file_name_)))
        throw std::runtime_error("in IniFile::processFile: file \"" + ini_file_name_ + "\" does not exist!");
    std::ifstream ini_file(ini_file_name_);
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + ini_file_name_ + "\"!");

    while (not ini_file.eof()) {
        std::string line;

        // Read lines until the newline character is not preceeded by a '\':
        bool continued_line(false);
        do {
            std::string buf;
            if (not std::getline(ini_file, buf))
                break;
            ++current_lineno_;
            line += StringUtil::Trim(buf, " \t\r");
            continued_line = not line.empty() and line[line.length() - 1] == '\\';
            if (continued_line)
                line = StringUtil::Trim(line.substr(0, line.length() - 1), " \t") + " ";
        } while (continued_line);

        StripComment(&line);
        StringUtil::Trim(" \t", &line);
        if (line.empty())
            continue;

        if (line[0] == '[')
            processSectionHeader(line);
        else {
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line);
        }
    }
}
