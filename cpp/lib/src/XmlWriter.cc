/** \file   XmlWriter.cc
 *  \brief  Implementation of class XmlWriter.
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
#include "XmlWriter.h"
#include <stdexcept>
#include "util.h"


XmlWriter::XmlWriter(std::string * const output_string, const XmlDeclarationWriteBehaviour xml_declaration_write_behaviour,
                     const unsigned indent_amount)
    : output_string_(output_string), indent_amount_(indent_amount), nesting_level_(0)
{
    if (xml_declaration_write_behaviour == WriteTheXmlDeclaration)
        *output_string_ += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
}


void XmlWriter::openTag(const std::string &tag_name, const Attributes &attribs, const bool suppress_newline) {
    indent();
    active_tags_.push(tag_name);
    ++nesting_level_;

    *output_string_ += "<" + tag_name;
    for (const auto &attrib : attribs)
        *output_string_ += " " + attrib.first + "=\"" + XmlEscape(attrib.second) + "\"";
    *output_string_ += suppress_newline ? ">" : ">\n";
}


void XmlWriter::closeTag(const std::string &tag_name, const bool suppress_indent) {
    if (unlikely(active_tags_.empty()))
        throw std::runtime_error("in XmlWriter::closeTag: trying to close a tag (" + tag_name + ") when none are open!");
    if (unlikely(active_tags_.top() != tag_name))
        throw std::runtime_error("in XmlWriter::closeTag: trying to close \"" + tag_name + "\" while \"" + active_tags_.top()
                                 + "\" is still open!");

    --nesting_level_;
    if (not suppress_indent)
        indent();
    *output_string_ += "</" + tag_name + ">\n";
    active_tags_.pop();
}


void XmlWriter::closeAllTags() {
    while (not active_tags_.empty()) {
        --nesting_level_;
        indent();
        *output_string_ += "</" + active_tags_.top() + ">\n";
        active_tags_.pop();
    }
}


void XmlWriter::writeTagsWithEscapedData(const std::string &tag_name, const Attributes &attribs, const std::string &characters) {
    openTag(tag_name, attribs, /* suppress_newline = */ true);
    *output_string_ += XmlEscape(characters);
    closeTag(tag_name, /* suppress_indent = */ true);
}


std::string XmlWriter::XmlEscape(const std::string &s) {
    std::string escaped_s;
    escaped_s.reserve(s.size());
    for (const char ch : s) {
        switch (ch) {
        case '&':
            escaped_s += "&amp;";
            break;
        case '<':
            escaped_s += "&lt;";
            break;
        case '>':
            escaped_s += "&gt;";
            break;
        case '"':
            escaped_s += "&quot;";
            break;
        case '\'':
            escaped_s += "&apos;";
            break;
        default:
            escaped_s += ch;
        }
    }

    return escaped_s;
}


void XmlWriter::indent() {
    *output_string_ += std::string(indent_amount_ * nesting_level_, ' ');
}
