/** \file   KORMARC.h
 *  \brief  Immutable value types for KORMARC bibliographic records and their error types.
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


#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>


namespace KORMARC {


/** \class  Error
 *  \brief  Base class of all exceptions thrown by the record model and the parser.
 *  \note   what() renders the message followed by the context, e.g. "bad tag (tag=ABC, line=3)".
 */
class Error : public std::runtime_error {
public:
    typedef std::vector<std::pair<std::string, std::string>> Context;
private:
    std::string message_;
    Context context_;
public:
    explicit Error(const std::string &message, const Context &context = {});

    inline const std::string &getMessage() const { return message_; }
    inline const Context &getContext() const { return context_; }
private:
    static std::string FormatMessage(const std::string &message, const Context &context);
};


class ParseError : public Error {
public:
    explicit ParseError(const std::string &message, const Context &context = {}): Error(message, context) { }
};


// Thrown when the first line of a record can't be turned into a Leader.
class LeaderParseError : public ParseError {
    size_t found_length_;
public:
    LeaderParseError(const std::string &message, const size_t found_length)
        : ParseError(message, { { "found_length", std::to_string(found_length) } }), found_length_(found_length) { }

    inline size_t getFoundLength() const { return found_length_; }
};


class FieldParseError : public ParseError {
    std::string tag_;
public:
    FieldParseError(const std::string &message, const std::string &tag)
        : ParseError(message, { { "tag", tag } }), tag_(tag) { }

    inline const std::string &getTag() const { return tag_; }
};


// Input that is not valid UTF-8.
class EncodingError : public ParseError {
public:
    explicit EncodingError(const std::string &message, const Context &context = {}): ParseError(message, context) { }
};


// Construction-time rejection of a value.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string &message, const Context &context = {}): Error(message, context) { }
};


class LeaderValidationError : public ValidationError {
public:
    explicit LeaderValidationError(const std::string &message, const Context &context = {}): ValidationError(message, context) { }
};


class FieldValidationError : public ValidationError {
public:
    explicit FieldValidationError(const std::string &message, const Context &context = {}): ValidationError(message, context) { }
};


class ConversionError : public Error {
public:
    explicit ConversionError(const std::string &message, const Context &context = {}): Error(message, context) { }
};


class JSONConversionError : public ConversionError {
public:
    explicit JSONConversionError(const std::string &message, const Context &context = {}): ConversionError(message, context) { }
};


class XMLConversionError : public ConversionError {
public:
    explicit XMLConversionError(const std::string &message, const Context &context = {}): ConversionError(message, context) { }
};


constexpr char DEFAULT_SUBFIELD_DELIMITER('|');
constexpr size_t LEADER_LENGTH(24);


/** \class  Tag
 *  \brief  A three character field tag, e.g. "245".
 */
class Tag {
    std::string tag_;
public:
    /** \throws FieldValidationError if "raw_tag" is not exactly 3 characters long. */
    explicit Tag(const std::string &raw_tag);

    inline bool operator==(const Tag &rhs) const { return tag_ == rhs.tag_; }
    inline bool operator!=(const Tag &rhs) const { return tag_ != rhs.tag_; }
    inline bool operator<(const Tag &rhs) const { return tag_ < rhs.tag_; }
    inline bool operator==(const std::string &rhs) const { return tag_ == rhs; }
    inline bool operator!=(const std::string &rhs) const { return tag_ != rhs; }
    friend std::ostream &operator<<(std::ostream &output, const Tag &tag) { return output << tag.tag_; }

    inline const std::string &toString() const { return tag_; }
    inline const char *c_str() const { return tag_.c_str(); }

    // \return True if all three characters are ASCII digits.
    bool isNumeric() const;

    // \return True for 001 through 009.
    inline bool isTagOfControlField() const { return isNumeric() and tag_[0] == '0' and tag_[1] == '0' and tag_[2] != '0'; }

    // \return True for 010 through 999.
    inline bool isTagOfDataField() const { return isNumeric() and not (tag_[0] == '0' and tag_[1] == '0'); }
};


class Subfield {
    char code_;
    std::string data_;
public:
    Subfield(const char code, const std::string &data): code_(code), data_(data) { }

    inline char getCode() const { return code_; }
    inline const std::string &getData() const { return data_; }

    inline bool operator==(const Subfield &rhs) const { return code_ == rhs.code_ and data_ == rhs.data_; }
    inline bool operator!=(const Subfield &rhs) const { return not operator==(rhs); }
};


/** \brief Leader position 05. */
enum class RecordStatus {
    INCREASE_IN_ENCODING_LEVEL,   // a
    CORRECTED_OR_REVISED,         // c
    DELETED,                      // d
    NEW,                          // n
    INCREASE_FROM_PREPUBLICATION  // p
};


/** \brief Leader position 06. */
enum class TypeOfRecord {
    LANGUAGE_MATERIAL,                     // a
    NOTATED_MUSIC,                         // c
    MANUSCRIPT_NOTATED_MUSIC,              // d
    CARTOGRAPHIC_MATERIAL,                 // e
    MANUSCRIPT_CARTOGRAPHIC_MATERIAL,      // f
    PROJECTED_MEDIUM,                      // g
    NONMUSICAL_SOUND_RECORDING,            // i
    MUSICAL_SOUND_RECORDING,               // j
    TWO_DIMENSIONAL_NONPROJECTABLE_GRAPHIC, // k
    COMPUTER_FILE,                         // m
    KIT,                                   // o
    MIXED_MATERIALS,                       // p
    THREE_DIMENSIONAL_ARTIFACT,            // r
    MANUSCRIPT_LANGUAGE_MATERIAL           // t
};


/** \brief Leader position 07. */
enum class BibliographicLevel {
    MONOGRAPHIC_COMPONENT_PART, // a
    SERIAL_COMPONENT_PART,      // b
    COLLECTION,                 // c
    SUBUNIT,                    // d
    INTEGRATING_RESOURCE,       // i
    MONOGRAPH_OR_ITEM,          // m
    SERIAL                      // s
};


// The following throw a LeaderValidationError for characters outside of the respective closed set.
RecordStatus CharToRecordStatus(const char ch);
TypeOfRecord CharToTypeOfRecord(const char ch);
BibliographicLevel CharToBibliographicLevel(const char ch);

char RecordStatusToChar(const RecordStatus record_status);
char TypeOfRecordToChar(const TypeOfRecord type_of_record);
char BibliographicLevelToChar(const BibliographicLevel bibliographic_level);


/** \class  Leader
 *  \brief  The 24 character fixed-length header of a record.
 */
class Leader {
    unsigned record_length_;
    RecordStatus record_status_;
    TypeOfRecord type_of_record_;
    BibliographicLevel bibliographic_level_;
    char control_type_;
    char character_encoding_;
    unsigned indicator_count_;
    unsigned subfield_code_count_;
    unsigned base_address_;
    char encoding_level_;
    char descriptive_cataloging_;
    char multipart_level_;
    std::string entry_map_;
public:
    /** \throws LeaderValidationError if a numeric value doesn't fit its positions or "entry_map" is not 4 characters long. */
    Leader(const unsigned record_length, const RecordStatus record_status, const TypeOfRecord type_of_record,
           const BibliographicLevel bibliographic_level, const char control_type, const char character_encoding,
           const unsigned indicator_count, const unsigned subfield_code_count, const unsigned base_address,
           const char encoding_level, const char descriptive_cataloging, const char multipart_level,
           const std::string &entry_map);

    /** \brief  Parses the positional form, e.g. "00714cam  2200205 a 4500".
     *  \throws LeaderValidationError if "leader_string" is not exactly 24 characters long or any position holds an illegal value.
     */
    static Leader FromString(const std::string &leader_string);

    /** \brief  Accepts either the positional string or the object produced by toJson().
     *  \throws JSONConversionError if keys are missing or have the wrong JSON type, LeaderValidationError for illegal values.
     */
    static Leader FromJson(const nlohmann::json &json);

    inline unsigned getRecordLength() const { return record_length_; }
    inline RecordStatus getRecordStatus() const { return record_status_; }
    inline TypeOfRecord getTypeOfRecord() const { return type_of_record_; }
    inline BibliographicLevel getBibliographicLevel() const { return bibliographic_level_; }
    inline char getControlType() const { return control_type_; }
    inline char getCharacterEncoding() const { return character_encoding_; }
    inline unsigned getIndicatorCount() const { return indicator_count_; }
    inline unsigned getSubfieldCodeCount() const { return subfield_code_count_; }
    inline unsigned getBaseAddress() const { return base_address_; }
    inline char getEncodingLevel() const { return encoding_level_; }
    inline char getDescriptiveCataloging() const { return descriptive_cataloging_; }
    inline char getMultipartLevel() const { return multipart_level_; }
    inline const std::string &getEntryMap() const { return entry_map_; }

    // \return The 24 character positional form.
    std::string toString() const;

    nlohmann::json toJson() const;

    bool operator==(const Leader &rhs) const;
    inline bool operator!=(const Leader &rhs) const { return not operator==(rhs); }
};


class ControlField {
    Tag tag_;
    std::string data_;
public:
    /** \throws FieldValidationError if "tag" is not in the range 001-009. */
    ControlField(const Tag &tag, const std::string &data);
    ControlField(const std::string &tag, const std::string &data): ControlField(Tag(tag), data) { }

    inline const Tag &getTag() const { return tag_; }
    inline const std::string &getData() const { return data_; }

    inline bool operator==(const ControlField &rhs) const { return tag_ == rhs.tag_ and data_ == rhs.data_; }
    inline bool operator!=(const ControlField &rhs) const { return not operator==(rhs); }
};


class DataField {
    Tag tag_;
    char indicator1_, indicator2_;
    std::vector<Subfield> subfields_;
public:
    typedef std::vector<Subfield>::const_iterator const_iterator;
public:
    /** \throws FieldValidationError if "tag" is not in the range 010-999. */
    DataField(const Tag &tag, const char indicator1, const char indicator2, const std::vector<Subfield> &subfields);
    DataField(const std::string &tag, const char indicator1, const char indicator2, const std::vector<Subfield> &subfields)
        : DataField(Tag(tag), indicator1, indicator2, subfields) { }

    inline const Tag &getTag() const { return tag_; }
    inline char getIndicator1() const { return indicator1_; }
    inline char getIndicator2() const { return indicator2_; }
    inline const std::vector<Subfield> &getSubfields() const { return subfields_; }
    inline const_iterator begin() const { return subfields_.cbegin(); }
    inline const_iterator end() const { return subfields_.cend(); }
    inline bool empty() const { return subfields_.empty(); }

    inline bool hasSubfield(const char subfield_code) const { return findSubfield(subfield_code) != end(); }

    // \return The data of the first subfield with code "subfield_code" or the empty string if there is none.
    std::string getFirstSubfieldValue(const char subfield_code) const;

    std::vector<std::string> getSubfieldValues(const char subfield_code) const;

    bool operator==(const DataField &rhs) const;
    inline bool operator!=(const DataField &rhs) const { return not operator==(rhs); }
private:
    const_iterator findSubfield(const char subfield_code) const;
};


/** \class  Record
 *  \brief  A leader plus ordered control and data fields.  Instances are never modified after construction.
 */
class Record {
    Leader leader_;
    std::vector<ControlField> control_fields_;
    std::vector<DataField> data_fields_;
public:
    explicit Record(const Leader &leader, const std::vector<ControlField> &control_fields = {},
                    const std::vector<DataField> &data_fields = {})
        : leader_(leader), control_fields_(control_fields), data_fields_(data_fields) { }

    inline const Leader &getLeader() const { return leader_; }
    inline const std::vector<ControlField> &getControlFields() const { return control_fields_; }
    inline const std::vector<DataField> &getDataFields() const { return data_fields_; }

    bool hasControlField(const std::string &tag) const;
    bool hasDataField(const std::string &tag) const;

    // \return A pointer to the first control field tagged "tag" or nullptr if there is none.
    const ControlField *getControlField(const std::string &tag) const;

    // \return A pointer to the first data field tagged "tag" or nullptr if there is none.
    const DataField *getFirstDataField(const std::string &tag) const;

    std::vector<DataField> getDataFields(const std::string &tag) const;

    // \return The contents of field 001 or the empty string.
    std::string getControlNumber() const;

    /** \return The first 020$a or 024$a that consists of digits only once hyphens and spaces have been removed, or the
     *          empty string if there is no such subfield.
     */
    std::string getISBN() const;

    // The following return a copy of this record with "new_field" appended.
    Record withControlField(const ControlField &new_field) const;
    Record withDataField(const DataField &new_field) const;

    /** \brief Renders the record in the line-oriented input grammar, i.e. the leader on the first line followed by one
     *         "TAG CONTENT" line per field.
     */
    std::string toLineFormat(const char subfield_delimiter = DEFAULT_SUBFIELD_DELIMITER) const;

    nlohmann::json toJson() const;

    /** \brief  Reconstructs a record from the output of toJson().
     *  \note   Data fields may alternatively carry a two-character "indicators" string instead of "indicator1" and "indicator2".
     *  \throws JSONConversionError for structural problems, ValidationError for illegal values.
     */
    static Record FromJson(const nlohmann::json &json);

    // \return A MARCXML document including an XML declaration.
    std::string toMarcXml() const;

    bool operator==(const Record &rhs) const;
    inline bool operator!=(const Record &rhs) const { return not operator==(rhs); }
};


} // namespace KORMARC
