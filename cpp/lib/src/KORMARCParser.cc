/** \file   KORMARCParser.cc
 *  \brief  Implementation of the KORMARC text notation parser.
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
#include "KORMARCParser.h"
#include <memory>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace KORMARC {


namespace {


// Tags "1" through "9", with or without leading zeroes, are control field tags.
bool IsControlFieldTag(const std::string &tag) {
    if (not StringUtil::IsUnsignedNumber(tag))
        return false;

    const auto first_non_zero_pos(tag.find_first_not_of('0'));
    return first_non_zero_pos == std::string::npos or (first_non_zero_pos == tag.length() - 1);
}


} // unnamed namespace


DataField Parser::parseDataField(const std::string &tag, const std::string &content) const {
    const auto first_delimiter_pos(content.find(subfield_delimiter_));
    if (first_delimiter_pos == std::string::npos) {
        std::vector<Subfield> subfields;
        const std::string trimmed_content(StringUtil::TrimWhite(content));
        if (not trimmed_content.empty())
            subfields.emplace_back('a', trimmed_content);
        return DataField(tag, ' ', ' ', subfields);
    }

    std::string indicators;
    for (const char ch : content.substr(0, first_delimiter_pos)) {
        if (not StringUtil::IsDigit(ch) and ch != ' ')
            break;
        indicators += ch;
    }
    while (indicators.length() < 2)
        indicators += ' ';

    std::vector<std::string> chunks;
    StringUtil::SplitThenTrimWhite(content.substr(first_delimiter_pos + 1), subfield_delimiter_, &chunks);

    std::vector<Subfield> subfields;
    for (const auto &chunk : chunks) {
        if (unlikely(static_cast<unsigned char>(chunk[0]) >= 0x80u))
            throw FieldValidationError("Subfield code must be a single ASCII character", { { "chunk", chunk } });
        subfields.emplace_back(chunk[0], chunk.substr(1));
    }

    return DataField(tag, indicators[0], indicators[1], subfields);
}


Record Parser::parse(const std::string &text) const {
    if (unlikely(not StringUtil::IsValidUTF8(text)))
        throw EncodingError("Invalid UTF-8 encoding", { { "size", std::to_string(text.size()) } });

    std::vector<std::string> lines;
    StringUtil::SplitThenTrimWhite(text, '\n', &lines);
    if (unlikely(lines.empty()))
        throw ParseError("Empty record");

    const std::string &leader_line(lines.front());
    std::unique_ptr<Leader> leader;
    try {
        leader.reset(new Leader(Leader::FromString(leader_line)));
    } catch (const LeaderValidationError &x) {
        throw LeaderParseError("Failed to parse leader: " + x.getMessage(), leader_line.length());
    }

    std::vector<ControlField> control_fields;
    std::vector<DataField> data_fields;
    for (auto line(lines.cbegin() + 1); line != lines.cend(); ++line) {
        const auto tag_end_pos(line->find_first_of(StringUtil::WHITE_SPACE));
        if (tag_end_pos == std::string::npos) {
            if (strict_)
                throw FieldParseError("Field line without content", *line);
            LOG_DEBUG("skipping field line without content: \"" + *line + "\"");
            continue;
        }

        const std::string raw_tag(line->substr(0, tag_end_pos));
        const std::string content(line->substr(line->find_first_not_of(StringUtil::WHITE_SPACE, tag_end_pos)));
        const std::string tag(StringUtil::PadLeading(raw_tag, 3, '0'));
        try {
            if (IsControlFieldTag(raw_tag))
                control_fields.emplace_back(tag, content);
            else
                data_fields.emplace_back(parseDataField(tag, content));
        } catch (const ValidationError &x) {
            throw FieldParseError("Failed to parse field " + tag + ": " + x.getMessage(), tag);
        }
    }

    return Record(*leader, control_fields, data_fields);
}


Record Parser::parseFile(const std::string &path) const {
    std::string text;
    if (unlikely(not FileUtil::ReadString(path, &text)))
        throw ParseError("Can't read record file", { { "path", path } });

    return parse(text);
}


} // namespace KORMARC
