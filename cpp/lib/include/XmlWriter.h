/** \file   XmlWriter.h
 *  \brief  Declaration of class XmlWriter, a simple XML generator.
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


#include <stack>
#include <string>
#include <utility>
#include <vector>


/** \class  XmlWriter
 *  \brief  Appends well-formed, optionally indented XML to a string.
 */
class XmlWriter {
public:
    enum XmlDeclarationWriteBehaviour { WriteTheXmlDeclaration, DoNotWriteTheXmlDeclaration };
    typedef std::vector<std::pair<std::string, std::string>> Attributes;
private:
    std::string * const output_string_;
    std::stack<std::string> active_tags_;
    const unsigned indent_amount_;
    unsigned nesting_level_;
public:
    /** \brief  Instantiate an XmlWriter object.
     *  \param  output_string                    Where to write the generated XML to.
     *  \param  xml_declaration_write_behaviour  Whether to write an XML declaration or not.
     *  \param  indent_amount                    How many leading spaces to add per indentation level.
     */
    explicit XmlWriter(std::string * const output_string,
                       const XmlDeclarationWriteBehaviour xml_declaration_write_behaviour = WriteTheXmlDeclaration,
                       const unsigned indent_amount = 0);

    /** Destroys an XmlWriter object, closing any still open tags. */
    ~XmlWriter() { closeAllTags(); }

    /** Writes an open tag at the current indentation level. */
    void openTag(const std::string &tag_name, const Attributes &attribs = {}, const bool suppress_newline = false);

    /** \brief  Closes the most recently opened tag.
     *  \throws std::runtime_error if no tag is open or "tag_name" does not name the innermost open tag.
     */
    void closeTag(const std::string &tag_name, const bool suppress_indent = false);

    void closeAllTags();

    /** Write character data between an opening and closing tag pair on a single line. */
    void writeTagsWithEscapedData(const std::string &tag_name, const Attributes &attribs, const std::string &characters);
    inline void writeTagsWithEscapedData(const std::string &tag_name, const std::string &characters)
        { writeTagsWithEscapedData(tag_name, {}, characters); }

    // \brief Replaces '&', '<', '>', '"' and '\'' with the corresponding XML entities.
    static std::string XmlEscape(const std::string &s);
private:
    void indent();
};
