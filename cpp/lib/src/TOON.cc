/** \file   TOON.cc
 *  \brief  Implementation of TOON identifier generation and parsing.
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
#include "TOON.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include "Base32.h"
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace TOON {


namespace {


const ThreadSafeRegexMatcher TYPE_PREFIX_MATCHER("^[a-z]+(?:_[a-z]+)*$");
const ThreadSafeRegexMatcher TOON_ID_MATCHER("^([a-z]+(?:_[a-z]+)*)_([0-9a-hjkmnp-tv-z]{26})$",
                                             ThreadSafeRegexMatcher::ENABLE_UTF8 | ThreadSafeRegexMatcher::CASE_INSENSITIVE);
constexpr uint64_t TIMESTAMP_MASK(0xFFFFFFFFFFFFULL);


std::string GetRandomBytes() {
    unsigned char random_bytes[RANDOM_BYTE_COUNT];
    if (unlikely(::RAND_bytes(random_bytes, sizeof(random_bytes)) != 1))
        throw std::runtime_error("in TOON::GetRandomBytes: RAND_bytes failed! (OpenSSL error code: "
                                 + std::to_string(::ERR_get_error()) + ")");
    return std::string(reinterpret_cast<const char *>(random_bytes), sizeof(random_bytes));
}


} // unnamed namespace


std::string Info::getCreatedAtAsString() const {
    return TimeUtil::MillisecondsToZuluString(timestamp_ms_);
}


nlohmann::json Info::toJson() const {
    return nlohmann::json{ { "type", type_ },
                           { "subtype", subtype_ },
                           { "ulid", ulid_ },
                           { "timestamp_ms", timestamp_ms_ },
                           { "created_at", getCreatedAtAsString() } };
}


std::string Generate(const std::string &type_prefix) {
    return Generate(type_prefix, TimeUtil::GetCurrentTimeInMilliseconds(), GetRandomBytes());
}


std::string Generate(const std::string &type_prefix, const uint64_t timestamp_ms) {
    return Generate(type_prefix, timestamp_ms, GetRandomBytes());
}


std::string Generate(const std::string &type_prefix, const uint64_t timestamp_ms, const std::string &random_bytes) {
    const std::string normalised_prefix(StringUtil::ASCIIToLower(type_prefix));
    if (unlikely(not TYPE_PREFIX_MATCHER.matched(normalised_prefix)))
        throw ValidationError("Invalid TOON type prefix: " + type_prefix);
    if (unlikely(random_bytes.size() != RANDOM_BYTE_COUNT))
        throw ValidationError("Random bytes must be " + std::to_string(RANDOM_BYTE_COUNT) + " bytes, got "
                              + std::to_string(random_bytes.size()));

    const uint64_t truncated_timestamp(timestamp_ms & TIMESTAMP_MASK);
    std::string binary_id;
    for (int shift(8 * (TIMESTAMP_BYTE_COUNT - 1)); shift >= 0; shift -= 8)
        binary_id += static_cast<char>((truncated_timestamp >> shift) & 0xFFu);
    binary_id += random_bytes;

    return normalised_prefix + "_" + Base32::Encode(binary_id).substr(0, PAYLOAD_LENGTH);
}


Info Parse(const std::string &toon_id) {
    const std::string normalised_id(StringUtil::ASCIIToLower(StringUtil::TrimWhite(toon_id)));
    const auto match(TOON_ID_MATCHER.match(normalised_id));
    if (not match) {
        if (not match.getErrorMessage().empty())
            throw ValidationError("Invalid TOON format (" + match.getErrorMessage() + "): " + toon_id);
        throw ValidationError("Invalid TOON format: " + toon_id);
    }

    Info info;
    info.type_ = match[1];
    info.ulid_ = StringUtil::ASCIIToUpper(match[2]);

    const auto first_underscore_pos(info.type_.find('_'));
    info.subtype_ = (first_underscore_pos == std::string::npos) ? "" : info.type_.substr(first_underscore_pos + 1);

    std::string binary_id;
    try {
        binary_id = Base32::Decode(info.ulid_);
    } catch (const Base32::DecodeError &x) {
        throw ValidationError("Invalid TOON payload: " + std::string(x.what()));
    }

    info.timestamp_ms_ = 0;
    for (size_t i(0); i < TIMESTAMP_BYTE_COUNT; ++i)
        info.timestamp_ms_ = (info.timestamp_ms_ << 8u) | static_cast<unsigned char>(binary_id[i]);
    info.created_at_ = static_cast<time_t>(info.timestamp_ms_ / 1000u);

    return info;
}


bool Validate(const std::string &toon_id) {
    try {
        Parse(toon_id);
        return true;
    } catch (const ValidationError &) {
        return false;
    }
}


std::string DetermineRecordType(const KORMARC::Record &record) {
    if (not record.hasControlField("008"))
        return "kormarc_unknown";

    switch (record.getLeader().getBibliographicLevel()) {
    case KORMARC::BibliographicLevel::MONOGRAPH_OR_ITEM:
        return "kormarc_book";
    case KORMARC::BibliographicLevel::SERIAL:
        return "kormarc_serial";
    case KORMARC::BibliographicLevel::MONOGRAPHIC_COMPONENT_PART:
        return "kormarc_academic";
    case KORMARC::BibliographicLevel::COLLECTION:
    case KORMARC::BibliographicLevel::SUBUNIT:
        return "kormarc_comic";
    default:
        return "kormarc_unknown";
    }
}


nlohmann::json ToJson(const KORMARC::Record &record, const std::string &toon_id, const std::string &raw_kormarc) {
    const Info info(Parse(toon_id));

    nlohmann::json parsed(record.toJson());
    for (auto &data_field : parsed["data_fields"]) {
        data_field["indicators"] = data_field["indicator1"].get<std::string>() + data_field["indicator2"].get<std::string>();
        data_field.erase("indicator1");
        data_field.erase("indicator2");
    }

    return nlohmann::json{ { "toon_id", toon_id },
                           { "timestamp", info.getCreatedAtAsString() },
                           { "type", info.type_ },
                           { "isbn", record.getISBN() },
                           { "raw_kormarc", raw_kormarc.empty() ? record.toLineFormat() : raw_kormarc },
                           { "parsed", parsed } };
}


} // namespace TOON
