/** \file   KORMARCBuilder.h
 *  \brief  Assembles KORMARC records from structured book metadata.
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


#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>
#include <ctime>
#include <nlohmann/json.hpp>
#include "KORMARC.h"
#include "ThreadUtil.h"


namespace KORMARC {


// Empty strings denote missing values.
struct BookInfo {
    std::string isbn_;
    std::string title_;
    std::string author_;
    std::string publisher_;
    std::string pub_year_; // YYYY or YYYYMM
    std::optional<unsigned> pages_;
    std::string kdc_;      // Korean Decimal Classification
    std::string category_; // "book", "serial", "academic" or "comic"
    std::optional<unsigned> price_;
    std::string description_;
public:
    BookInfo(const std::string &isbn, const std::string &title): isbn_(isbn), title_(title), category_("book") { }
};


struct BookInfoValidation {
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
public:
    inline bool isValid() const { return errors_.empty(); }
    void append(const BookInfoValidation &other);
};


// \return "isbn" without hyphens and blanks.
std::string NormaliseISBN(const std::string &isbn);

// Checks the length, the format and the check digit of an ISBN-10 or ISBN-13 after normalisation.
BookInfoValidation ValidateISBN(const std::string &isbn);

// A KDC class number consists of 1 to 3 digits.
BookInfoValidation ValidateKDC(const std::string &kdc);

// \return The name of the main class of "kdc", e.g. "문학" for "813", or "알 수 없음".
std::string GetKDCCategoryName(const std::string &kdc);

// YYYY or YYYYMM with a year between 1900 and 5 years after "current_year".
BookInfoValidation ValidatePublicationYear(const std::string &pub_year, const unsigned current_year);

BookInfoValidation ValidateCategory(const std::string &category);

/** \brief  Runs all of the above on the respective members of "book_info".
 *  \note   A missing ISBN, publisher or KDC number only results in a warning.
 */
BookInfoValidation ValidateBookInfo(const BookInfo &book_info);


/** \class  RecordBuilder
 *  \brief  Creates records from BookInfo instances.
 *  \note   Control numbers are taken from a counter that is owned by the builder, so several threads may share one
 *          builder.
 */
class RecordBuilder {
    ThreadSafeCounter<uint64_t> next_control_number_;
public:
    explicit RecordBuilder(const uint64_t first_control_number = 100000): next_control_number_(first_control_number) { }

    inline Record build(const BookInfo &book_info) { return build(book_info, std::time(nullptr)); }

    // Uses "now" for the 005 and 008 fields.
    Record build(const BookInfo &book_info, const time_t now);

    /** \return The record and a newly generated TOON identifier whose type depends on the category of "book_info". */
    std::pair<Record, std::string> buildWithTOON(const BookInfo &book_info);

    // \return The storage document with the MARCXML form of the new record as "raw_kormarc".
    nlohmann::json buildTOONJson(const BookInfo &book_info);

    // \return e.g. "kormarc_serial" for "serial", "kormarc_book" for unknown categories.
    static std::string CategoryToTOONType(const std::string &category);
};


} // namespace KORMARC
