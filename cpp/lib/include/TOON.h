/** \file   TOON.h
 *  \brief  Typed, time-ordered, Base32-encoded record identifiers ("TOON" identifiers).
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


#include <stdexcept>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "KORMARC.h"


/** \namespace TOON
 *  \brief     Identifiers of the form "<type_prefix>_<26 Base32 symbols>".
 *
 *  The 26 symbols encode 16 bytes: a 48-bit big-endian millisecond Unix timestamp followed by 80 random bits.
 *  Identifiers sharing a type prefix therefore sort chronologically when compared as strings.
 */
namespace TOON {


constexpr size_t PAYLOAD_LENGTH(26);
constexpr size_t RANDOM_BYTE_COUNT(10);
constexpr size_t TIMESTAMP_BYTE_COUNT(6);


class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string &message): std::runtime_error(message) { }
};


struct Info {
    std::string type_;     // The entire prefix, e.g. "kormarc_book".
    std::string subtype_;  // All prefix segments after the first, e.g. "book", may be empty.
    std::string ulid_;     // The 26 upper-case payload symbols.
    uint64_t timestamp_ms_;
    time_t created_at_;    // "timestamp_ms_" truncated to seconds.
public:
    // \return e.g. "2026-01-11T12:00:00.123Z"
    std::string getCreatedAtAsString() const;

    nlohmann::json toJson() const;
};


/** \brief  Generates a new identifier for the current time and fresh random bits.
 *  \param  type_prefix  One or more underscore-separated runs of ASCII letters, e.g. "kormarc_book".  Upper-case letters
 *                       are converted to lower case.
 *  \throws ValidationError if "type_prefix" is malformed.
 */
std::string Generate(const std::string &type_prefix);

// Like the above but with an explicit timestamp.  Only the low 48 bits of "timestamp_ms" are used.
std::string Generate(const std::string &type_prefix, const uint64_t timestamp_ms);

// Deterministic variant for tests.  "random_bytes" must be exactly RANDOM_BYTE_COUNT bytes long.
std::string Generate(const std::string &type_prefix, const uint64_t timestamp_ms, const std::string &random_bytes);


/** \brief  Splits an identifier into its components.
 *  \note   Input is matched case-insensitively and may be surrounded by whitespace.
 *  \throws ValidationError if "toon_id" is not a well-formed identifier.
 */
Info Parse(const std::string &toon_id);


// \return True if Parse() would succeed, else false.
bool Validate(const std::string &toon_id);


// \return The creation time embedded in "toon_id" in milliseconds since the Unix epoch.
inline uint64_t ExtractTimestamp(const std::string &toon_id) { return Parse(toon_id).timestamp_ms_; }


/** \brief  Chooses the type prefix for a record.
 *  \return "kormarc_unknown" if the record has no 008 field, otherwise one of "kormarc_book", "kormarc_serial",
 *          "kormarc_academic", "kormarc_comic" or "kormarc_unknown" depending on the bibliographic level.
 */
std::string DetermineRecordType(const KORMARC::Record &record);


/** \brief  Builds the storage document for "record" which has been assigned "toon_id".
 *  \param  raw_kormarc  The original text form of the record.  If empty, the line format of "record" is used.
 *  \throws ValidationError if "toon_id" is malformed.
 */
nlohmann::json ToJson(const KORMARC::Record &record, const std::string &toon_id, const std::string &raw_kormarc = "");


} // namespace TOON
