/** \file   KORMARCParser.h
 *  \brief  A parser for the line-oriented KORMARC text notation.
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


#include <string>
#include <vector>
#include "KORMARC.h"


namespace KORMARC {


/** \class  Parser
 *  \brief  Turns the text notation into a Record.
 *
 *  The first non-empty line holds the 24 character leader.  Each following non-empty line has the form
 *  "TAG CONTENT".  Tags 1 through 9 (zero-padding is optional) denote control fields whose content is stored as is.
 *  For all other tags the content is "[indicators]<delim><code><data><delim><code><data>...", where up to two
 *  digits or blanks before the first delimiter become the indicators.  Content without any delimiter becomes a
 *  single subfield "a".
 *
 *  In the default, permissive mode a line consisting of a tag only is skipped.  Strict mode rejects such lines.
 */
class Parser {
    char subfield_delimiter_;
    bool strict_;
public:
    explicit Parser(const char subfield_delimiter = DEFAULT_SUBFIELD_DELIMITER, const bool strict = false)
        : subfield_delimiter_(subfield_delimiter), strict_(strict) { }

    inline char getSubfieldDelimiter() const { return subfield_delimiter_; }
    inline bool isStrict() const { return strict_; }

    /** \brief  Parses a single record.
     *  \param  text  UTF-8 encoded input.
     *  \throws EncodingError for invalid UTF-8, LeaderParseError for a bad first line, FieldParseError for a bad field
     *          line and ParseError if there are no non-empty lines at all.
     */
    Record parse(const std::string &text) const;

    /** \brief  Reads "path" and parses its contents as a single record.
     *  \throws ParseError if the file can't be read, otherwise see parse().
     */
    Record parseFile(const std::string &path) const;

    /** \brief  Parses the content part of a data field line, i.e. everything after the tag.
     *  \throws FieldValidationError if "tag" is not a valid data field tag.
     */
    DataField parseDataField(const std::string &tag, const std::string &content) const;
};


} // namespace KORMARC
