/** \file   KORMARC.cc
 *  \brief  Implementation of the KORMARC record model.
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
#include "KORMARC.h"
#include <algorithm>
#include <iterator>
#include <limits>
#include <cstdint>
#include "StringUtil.h"
#include "XmlWriter.h"
#include "util.h"


namespace KORMARC {


const std::string MARCXML_NAMESPACE("http://www.loc.gov/MARC21/slim");


Error::Error(const std::string &message, const Context &context)
    : std::runtime_error(FormatMessage(message, context)), message_(message), context_(context) { }


std::string Error::FormatMessage(const std::string &message, const Context &context) {
    if (context.empty())
        return message;

    std::vector<std::string> key_value_pairs;
    for (const auto &key_and_value : context)
        key_value_pairs.emplace_back(key_and_value.first + "=" + key_and_value.second);
    return message + " (" + StringUtil::Join(key_value_pairs, ", ") + ")";
}


Tag::Tag(const std::string &raw_tag): tag_(raw_tag) {
    if (unlikely(raw_tag.length() != 3))
        throw FieldValidationError("Tag must be exactly 3 characters", { { "tag", raw_tag } });
}


bool Tag::isNumeric() const {
    return StringUtil::IsDigit(tag_[0]) and StringUtil::IsDigit(tag_[1]) and StringUtil::IsDigit(tag_[2]);
}


namespace {


const std::string RECORD_STATUS_CODES("acdnp");
const std::string TYPE_OF_RECORD_CODES("acdefgijkmoprt");
const std::string BIBLIOGRAPHIC_LEVEL_CODES("abcdims");


// Maps "ch" to its index in "codes" which doubles as the enumerator value.
template<typename EnumType> EnumType CharToEnum(const char ch, const std::string &codes, const std::string &position_name) {
    const auto index(codes.find(ch));
    if (unlikely(index == std::string::npos))
        throw LeaderValidationError("Invalid " + position_name + " '" + std::string(1, ch) + "'",
                                    { { "allowed", codes } });
    return static_cast<EnumType>(index);
}


unsigned ParseLeaderNumber(const std::string &leader_string, const size_t offset, const size_t length,
                           const std::string &position_name)
{
    const std::string digits(leader_string.substr(offset, length));
    if (unlikely(not StringUtil::IsUnsignedNumber(digits)))
        throw LeaderValidationError("Leader " + position_name + " must be numeric", { { "value", digits } });
    return StringUtil::ToUnsigned(digits);
}


} // unnamed namespace


RecordStatus CharToRecordStatus(const char ch) {
    return CharToEnum<RecordStatus>(ch, RECORD_STATUS_CODES, "record status");
}


TypeOfRecord CharToTypeOfRecord(const char ch) {
    return CharToEnum<TypeOfRecord>(ch, TYPE_OF_RECORD_CODES, "type of record");
}


BibliographicLevel CharToBibliographicLevel(const char ch) {
    return CharToEnum<BibliographicLevel>(ch, BIBLIOGRAPHIC_LEVEL_CODES, "bibliographic level");
}


char RecordStatusToChar(const RecordStatus record_status) {
    return RECORD_STATUS_CODES[static_cast<size_t>(record_status)];
}


char TypeOfRecordToChar(const TypeOfRecord type_of_record) {
    return TYPE_OF_RECORD_CODES[static_cast<size_t>(type_of_record)];
}


char BibliographicLevelToChar(const BibliographicLevel bibliographic_level) {
    return BIBLIOGRAPHIC_LEVEL_CODES[static_cast<size_t>(bibliographic_level)];
}


Leader::Leader(const unsigned record_length, const RecordStatus record_status, const TypeOfRecord type_of_record,
               const BibliographicLevel bibliographic_level, const char control_type, const char character_encoding,
               const unsigned indicator_count, const unsigned subfield_code_count, const unsigned base_address,
               const char encoding_level, const char descriptive_cataloging, const char multipart_level,
               const std::string &entry_map)
    : record_length_(record_length), record_status_(record_status), type_of_record_(type_of_record),
      bibliographic_level_(bibliographic_level), control_type_(control_type), character_encoding_(character_encoding),
      indicator_count_(indicator_count), subfield_code_count_(subfield_code_count), base_address_(base_address),
      encoding_level_(encoding_level), descriptive_cataloging_(descriptive_cataloging), multipart_level_(multipart_level),
      entry_map_(entry_map)
{
    if (unlikely(record_length_ > 99999))
        throw LeaderValidationError("Record length must fit into 5 digits", { { "record_length", std::to_string(record_length_) } });
    if (unlikely(base_address_ > 99999))
        throw LeaderValidationError("Base address must fit into 5 digits", { { "base_address", std::to_string(base_address_) } });
    if (unlikely(indicator_count_ > 9))
        throw LeaderValidationError("Indicator count must be a single digit",
                                    { { "indicator_count", std::to_string(indicator_count_) } });
    if (unlikely(subfield_code_count_ > 9))
        throw LeaderValidationError("Subfield code count must be a single digit",
                                    { { "subfield_code_count", std::to_string(subfield_code_count_) } });
    if (unlikely(entry_map_.length() != 4))
        throw LeaderValidationError("Entry map must be exactly 4 characters", { { "entry_map", entry_map_ } });
}


Leader Leader::FromString(const std::string &leader_string) {
    if (unlikely(leader_string.length() != LEADER_LENGTH))
        throw LeaderValidationError("Leader must be exactly 24 characters, got " + std::to_string(leader_string.length())
                                    + " characters");

    return Leader(ParseLeaderNumber(leader_string, 0, 5, "record length"),
                  CharToRecordStatus(leader_string[5]),
                  CharToTypeOfRecord(leader_string[6]),
                  CharToBibliographicLevel(leader_string[7]),
                  leader_string[8],
                  leader_string[9],
                  ParseLeaderNumber(leader_string, 10, 1, "indicator count"),
                  ParseLeaderNumber(leader_string, 11, 1, "subfield code count"),
                  ParseLeaderNumber(leader_string, 12, 5, "base address"),
                  leader_string[17],
                  leader_string[18],
                  leader_string[19],
                  leader_string.substr(20, 4));
}


namespace {


const nlohmann::json &GetMember(const nlohmann::json &object, const std::string &key) {
    if (unlikely(not object.is_object()))
        throw JSONConversionError("Expected a JSON object", { { "key", key } });
    if (unlikely(not object.contains(key)))
        throw JSONConversionError("Missing key \"" + key + "\"");
    return object[key];
}


std::string GetString(const nlohmann::json &object, const std::string &key) {
    const auto &member(GetMember(object, key));
    if (unlikely(not member.is_string()))
        throw JSONConversionError("Key \"" + key + "\" must be a string", { { "found", member.type_name() } });
    return member.get<std::string>();
}


unsigned GetUnsigned(const nlohmann::json &object, const std::string &key) {
    const auto &member(GetMember(object, key));
    if (unlikely(not member.is_number_unsigned()))
        throw JSONConversionError("Key \"" + key + "\" must be a non-negative integer", { { "found", member.dump() } });
    const uint64_t value(member.get<uint64_t>());
    if (unlikely(value > std::numeric_limits<unsigned>::max()))
        throw JSONConversionError("Key \"" + key + "\" is out of range", { { "found", member.dump() } });
    return static_cast<unsigned>(value);
}


template<typename ExceptionType> char GetChar(const nlohmann::json &object, const std::string &key) {
    const std::string value(GetString(object, key));
    if (unlikely(value.length() != 1))
        throw ExceptionType("\"" + key + "\" must be exactly 1 character", { { "value", value } });
    return value[0];
}


inline std::string CharToString(const char ch) {
    return std::string(1, ch);
}


} // unnamed namespace


Leader Leader::FromJson(const nlohmann::json &json) {
    if (json.is_string())
        return FromString(json.get<std::string>());

    return Leader(GetUnsigned(json, "record_length"),
                  CharToRecordStatus(GetChar<LeaderValidationError>(json, "record_status")),
                  CharToTypeOfRecord(GetChar<LeaderValidationError>(json, "type_of_record")),
                  CharToBibliographicLevel(GetChar<LeaderValidationError>(json, "bibliographic_level")),
                  GetChar<LeaderValidationError>(json, "control_type"),
                  GetChar<LeaderValidationError>(json, "character_encoding"),
                  GetUnsigned(json, "indicator_count"),
                  GetUnsigned(json, "subfield_code_count"),
                  GetUnsigned(json, "base_address"),
                  GetChar<LeaderValidationError>(json, "encoding_level"),
                  GetChar<LeaderValidationError>(json, "descriptive_cataloging"),
                  GetChar<LeaderValidationError>(json, "multipart_level"),
                  GetString(json, "entry_map"));
}


std::string Leader::toString() const {
    std::string leader_string;
    leader_string.reserve(LEADER_LENGTH);
    leader_string += StringUtil::PadLeading(std::to_string(record_length_), 5, '0');
    leader_string += RecordStatusToChar(record_status_);
    leader_string += TypeOfRecordToChar(type_of_record_);
    leader_string += BibliographicLevelToChar(bibliographic_level_);
    leader_string += control_type_;
    leader_string += character_encoding_;
    leader_string += std::to_string(indicator_count_);
    leader_string += std::to_string(subfield_code_count_);
    leader_string += StringUtil::PadLeading(std::to_string(base_address_), 5, '0');
    leader_string += encoding_level_;
    leader_string += descriptive_cataloging_;
    leader_string += multipart_level_;
    leader_string += entry_map_;
    return leader_string;
}


nlohmann::json Leader::toJson() const {
    return nlohmann::json{
        { "record_length", record_length_ },
        { "record_status", CharToString(RecordStatusToChar(record_status_)) },
        { "type_of_record", CharToString(TypeOfRecordToChar(type_of_record_)) },
        { "bibliographic_level", CharToString(BibliographicLevelToChar(bibliographic_level_)) },
        { "control_type", CharToString(control_type_) },
        { "character_encoding", CharToString(character_encoding_) },
        { "indicator_count", indicator_count_ },
        { "subfield_code_count", subfield_code_count_ },
        { "base_address", base_address_ },
        { "encoding_level", CharToString(encoding_level_) },
        { "descriptive_cataloging", CharToString(descriptive_cataloging_) },
        { "multipart_level", CharToString(multipart_level_) },
        { "entry_map", entry_map_ },
    };
}


bool Leader::operator==(const Leader &rhs) const {
    return toString() == rhs.toString();
}


ControlField::ControlField(const Tag &tag, const std::string &data): tag_(tag), data_(data) {
    if (unlikely(not tag_.isTagOfControlField()))
        throw FieldValidationError("Control field tag must be in the range 001-009", { { "tag", tag_.toString() } });
}


DataField::DataField(const Tag &tag, const char indicator1, const char indicator2, const std::vector<Subfield> &subfields)
    : tag_(tag), indicator1_(indicator1), indicator2_(indicator2), subfields_(subfields)
{
    if (unlikely(not tag_.isTagOfDataField()))
        throw FieldValidationError("Data field tag must be in the range 010-999", { { "tag", tag_.toString() } });
}


DataField::const_iterator DataField::findSubfield(const char subfield_code) const {
    return std::find_if(subfields_.cbegin(), subfields_.cend(),
                        [subfield_code](const Subfield &subfield) { return subfield.getCode() == subfield_code; });
}


std::string DataField::getFirstSubfieldValue(const char subfield_code) const {
    const auto subfield(findSubfield(subfield_code));
    return (subfield == subfields_.cend()) ? "" : subfield->getData();
}


std::vector<std::string> DataField::getSubfieldValues(const char subfield_code) const {
    std::vector<std::string> values;
    for (const auto &subfield : subfields_) {
        if (subfield.getCode() == subfield_code)
            values.emplace_back(subfield.getData());
    }
    return values;
}


bool DataField::operator==(const DataField &rhs) const {
    return tag_ == rhs.tag_ and indicator1_ == rhs.indicator1_ and indicator2_ == rhs.indicator2_ and subfields_ == rhs.subfields_;
}


bool Record::hasControlField(const std::string &tag) const {
    return getControlField(tag) != nullptr;
}


bool Record::hasDataField(const std::string &tag) const {
    return getFirstDataField(tag) != nullptr;
}


const ControlField *Record::getControlField(const std::string &tag) const {
    for (const auto &control_field : control_fields_) {
        if (control_field.getTag() == tag)
            return &control_field;
    }
    return nullptr;
}


const DataField *Record::getFirstDataField(const std::string &tag) const {
    for (const auto &data_field : data_fields_) {
        if (data_field.getTag() == tag)
            return &data_field;
    }
    return nullptr;
}


std::vector<DataField> Record::getDataFields(const std::string &tag) const {
    std::vector<DataField> matching_fields;
    std::copy_if(data_fields_.cbegin(), data_fields_.cend(), std::back_inserter(matching_fields),
                 [&tag](const DataField &data_field) { return data_field.getTag() == tag; });
    return matching_fields;
}


std::string Record::getControlNumber() const {
    const ControlField * const field_001(getControlField("001"));
    return (field_001 == nullptr) ? "" : field_001->getData();
}


std::string Record::getISBN() const {
    for (const auto &data_field : data_fields_) {
        if (data_field.getTag() != "020" and data_field.getTag() != "024")
            continue;

        std::string candidate(data_field.getFirstSubfieldValue('a'));
        StringUtil::RemoveChars("- ", &candidate);
        if (StringUtil::IsUnsignedNumber(candidate))
            return candidate;
    }

    return "";
}


Record Record::withControlField(const ControlField &new_field) const {
    std::vector<ControlField> control_fields(control_fields_);
    control_fields.emplace_back(new_field);
    return Record(leader_, control_fields, data_fields_);
}


Record Record::withDataField(const DataField &new_field) const {
    std::vector<DataField> data_fields(data_fields_);
    data_fields.emplace_back(new_field);
    return Record(leader_, control_fields_, data_fields);
}


std::string Record::toLineFormat(const char subfield_delimiter) const {
    std::string lines(leader_.toString() + "\n");
    for (const auto &control_field : control_fields_)
        lines += control_field.getTag().toString() + " " + control_field.getData() + "\n";

    for (const auto &data_field : data_fields_) {
        lines += data_field.getTag().toString() + " " + data_field.getIndicator1() + data_field.getIndicator2();
        if (data_field.empty())
            lines += subfield_delimiter; // Without it the indicators would be re-read as an implicit $a.
        for (const auto &subfield : data_field)
            lines += subfield_delimiter + std::string(1, subfield.getCode()) + subfield.getData();
        lines += '\n';
    }

    return lines;
}


nlohmann::json Record::toJson() const {
    nlohmann::json control_fields(nlohmann::json::array());
    for (const auto &control_field : control_fields_)
        control_fields.push_back(nlohmann::json{ { "tag", control_field.getTag().toString() }, { "data", control_field.getData() } });

    nlohmann::json data_fields(nlohmann::json::array());
    for (const auto &data_field : data_fields_) {
        nlohmann::json subfields(nlohmann::json::array());
        for (const auto &subfield : data_field)
            subfields.push_back(nlohmann::json{ { "code", CharToString(subfield.getCode()) }, { "data", subfield.getData() } });

        data_fields.push_back(nlohmann::json{ { "tag", data_field.getTag().toString() },
                                { "indicator1", CharToString(data_field.getIndicator1()) },
                                { "indicator2", CharToString(data_field.getIndicator2()) },
                                { "subfields", subfields } });
    }

    return nlohmann::json{ { "leader", leader_.toJson() }, { "control_fields", control_fields }, { "data_fields", data_fields } };
}


namespace {


const nlohmann::json &GetOptionalArray(const nlohmann::json &object, const std::string &key) {
    static const nlohmann::json EMPTY_ARRAY(nlohmann::json::array());
    if (not object.contains(key) or object[key].is_null())
        return EMPTY_ARRAY;
    if (unlikely(not object[key].is_array()))
        throw JSONConversionError("Key \"" + key + "\" must be an array", { { "found", object[key].type_name() } });
    return object[key];
}


DataField DataFieldFromJson(const nlohmann::json &json) {
    const std::string tag(GetString(json, "tag"));

    char indicator1, indicator2;
    if (json.contains("indicators") and not json.contains("indicator1")) {
        const std::string indicators(GetString(json, "indicators"));
        indicator1 = indicators.length() > 0 ? indicators[0] : ' ';
        indicator2 = indicators.length() > 1 ? indicators[1] : ' ';
    } else {
        indicator1 = GetChar<FieldValidationError>(json, "indicator1");
        indicator2 = GetChar<FieldValidationError>(json, "indicator2");
    }

    std::vector<Subfield> subfields;
    for (const auto &subfield : GetOptionalArray(json, "subfields"))
        subfields.emplace_back(GetChar<FieldValidationError>(subfield, "code"), GetString(subfield, "data"));

    return DataField(tag, indicator1, indicator2, subfields);
}


} // unnamed namespace


Record Record::FromJson(const nlohmann::json &json) {
    if (unlikely(not json.is_object()))
        throw JSONConversionError("A record must be a JSON object", { { "found", json.type_name() } });

    const Leader leader(Leader::FromJson(GetMember(json, "leader")));

    std::vector<ControlField> control_fields;
    for (const auto &control_field : GetOptionalArray(json, "control_fields"))
        control_fields.emplace_back(GetString(control_field, "tag"), GetString(control_field, "data"));

    std::vector<DataField> data_fields;
    for (const auto &data_field : GetOptionalArray(json, "data_fields"))
        data_fields.emplace_back(DataFieldFromJson(data_field));

    return Record(leader, control_fields, data_fields);
}


std::string Record::toMarcXml() const {
    std::string xml;
    try {
        XmlWriter xml_writer(&xml, XmlWriter::WriteTheXmlDeclaration, /* indent_amount = */ 2);
        xml_writer.openTag("record", { { "xmlns", MARCXML_NAMESPACE } });
        xml_writer.writeTagsWithEscapedData("leader", leader_.toString());

        for (const auto &control_field : control_fields_)
            xml_writer.writeTagsWithEscapedData("controlfield", { { "tag", control_field.getTag().toString() } },
                                                control_field.getData());

        for (const auto &data_field : data_fields_) {
            xml_writer.openTag("datafield", { { "tag", data_field.getTag().toString() },
                                              { "ind1", CharToString(data_field.getIndicator1()) },
                                              { "ind2", CharToString(data_field.getIndicator2()) } });
            for (const auto &subfield : data_field)
                xml_writer.writeTagsWithEscapedData("subfield", { { "code", CharToString(subfield.getCode()) } }, subfield.getData());
            xml_writer.closeTag("datafield");
        }

        xml_writer.closeAllTags();
    } catch (const std::runtime_error &x) {
        throw XMLConversionError("MARCXML generation failed: " + std::string(x.what()),
                                 { { "control_number", getControlNumber() } });
    }

    return xml;
}


bool Record::operator==(const Record &rhs) const {
    return leader_ == rhs.leader_ and control_fields_ == rhs.control_fields_ and data_fields_ == rhs.data_fields_;
}


} // namespace KORMARC
