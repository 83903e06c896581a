/** \file   KORMARCBuilder.cc
 *  \brief  Implementation of the KORMARC record builder and the book metadata checks.
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
#include "KORMARCBuilder.h"
#include <algorithm>
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "TOON.h"
#include "TimeUtil.h"
#include "util.h"


namespace KORMARC {


void BookInfoValidation::append(const BookInfoValidation &other) {
    errors_.insert(errors_.end(), other.errors_.cbegin(), other.errors_.cend());
    warnings_.insert(warnings_.end(), other.warnings_.cbegin(), other.warnings_.cend());
}


std::string NormaliseISBN(const std::string &isbn) {
    std::string normalised_isbn(isbn);
    return StringUtil::RemoveChars("- ", &normalised_isbn);
}


namespace {


bool IsValidISBN10CheckDigit(const std::string &isbn10) {
    unsigned sum(0);
    for (unsigned i(0); i < 9; ++i)
        sum += (isbn10[i] - '0') * (10 - i);

    const unsigned check_digit((11 - sum % 11) % 11);
    const char last_char(isbn10[9]);
    return (check_digit == 10) ? (last_char == 'X' or last_char == 'x') : (last_char == static_cast<char>('0' + check_digit));
}


bool IsValidISBN13CheckDigit(const std::string &isbn13) {
    unsigned sum(0);
    for (unsigned i(0); i < 12; ++i)
        sum += (isbn13[i] - '0') * ((i % 2 == 0) ? 1 : 3);

    const unsigned check_digit((10 - sum % 10) % 10);
    return isbn13[12] == static_cast<char>('0' + check_digit);
}


const std::vector<std::string> KDC_MAIN_CLASSES{ "총류", "철학", "종교", "사회과학", "자연과학", "기술과학", "예술", "언어", "문학", "역사" };
const std::vector<std::string> CATEGORIES{ "book", "serial", "academic", "comic" };


} // unnamed namespace


BookInfoValidation ValidateISBN(const std::string &isbn) {
    static const ThreadSafeRegexMatcher isbn10_matcher("^[0-9]{9}[0-9Xx]$");
    static const ThreadSafeRegexMatcher isbn13_matcher("^[0-9]{13}$");

    BookInfoValidation validation;
    const std::string normalised_isbn(NormaliseISBN(isbn));
    if (normalised_isbn.length() == 10) {
        if (not isbn10_matcher.matched(normalised_isbn))
            validation.errors_.emplace_back("ISBN-10 형식 오류");
        else if (not IsValidISBN10CheckDigit(normalised_isbn))
            validation.errors_.emplace_back("ISBN-10 체크섬 오류");
    } else if (normalised_isbn.length() == 13) {
        if (not isbn13_matcher.matched(normalised_isbn))
            validation.errors_.emplace_back("ISBN-13 형식 오류");
        else if (not IsValidISBN13CheckDigit(normalised_isbn))
            validation.errors_.emplace_back("ISBN-13 체크섬 오류");
    } else
        validation.errors_.emplace_back("ISBN 길이 오류: " + std::to_string(normalised_isbn.length()) + "자리 (10 또는 13자리 필요)");

    return validation;
}


BookInfoValidation ValidateKDC(const std::string &kdc) {
    static const ThreadSafeRegexMatcher kdc_matcher("^[0-9][0-9]{0,2}$");

    BookInfoValidation validation;
    if (kdc.empty())
        validation.errors_.emplace_back("KDC 분류코드가 비어있습니다");
    else if (not kdc_matcher.matched(kdc))
        validation.errors_.emplace_back("KDC 형식 오류: " + kdc + " (0-9로 시작, 최대 3자리 숫자)");
    return validation;
}


std::string GetKDCCategoryName(const std::string &kdc) {
    if (kdc.empty() or not StringUtil::IsDigit(kdc[0]))
        return "알 수 없음";
    return KDC_MAIN_CLASSES[kdc[0] - '0'];
}


BookInfoValidation ValidatePublicationYear(const std::string &pub_year, const unsigned current_year) {
    static const ThreadSafeRegexMatcher pub_year_matcher("^[0-9]{4}([0-9]{2})?$");

    BookInfoValidation validation;
    if (not pub_year_matcher.matched(pub_year)) {
        validation.errors_.emplace_back("발행년 형식 오류: " + pub_year + " (YYYY 또는 YYYYMM 형식 필요)");
        return validation;
    }

    const unsigned year(StringUtil::ToUnsigned(pub_year.substr(0, 4)));
    if (year < 1900 or year > current_year + 5)
        validation.errors_.emplace_back("발행년 범위 오류: " + std::to_string(year) + " (1900-" + std::to_string(current_year + 5)
                                        + " 범위 필요)");
    return validation;
}


BookInfoValidation ValidateCategory(const std::string &category) {
    BookInfoValidation validation;
    if (std::find(CATEGORIES.cbegin(), CATEGORIES.cend(), category) == CATEGORIES.cend())
        validation.errors_.emplace_back("유효하지 않은 카테고리: " + category + " (유효한 카테고리: " + StringUtil::Join(CATEGORIES, ", ")
                                        + ")");
    return validation;
}


BookInfoValidation ValidateBookInfo(const BookInfo &book_info) {
    BookInfoValidation validation(ValidateISBN(book_info.isbn_));

    if (StringUtil::TrimWhite(book_info.title_).empty())
        validation.errors_.emplace_back("표제가 비어있습니다");
    if (not book_info.kdc_.empty())
        validation.append(ValidateKDC(book_info.kdc_));
    if (not book_info.pub_year_.empty())
        validation.append(ValidatePublicationYear(book_info.pub_year_, StringUtil::ToUnsigned(TimeUtil::GetCurrentYear())));
    if (book_info.pages_ and *book_info.pages_ == 0)
        validation.errors_.emplace_back("페이지수는 1 이상이어야 합니다");
    validation.append(ValidateCategory(book_info.category_));

    if (book_info.isbn_.empty())
        validation.warnings_.emplace_back("ISBN이 없습니다 (권장)");
    if (book_info.publisher_.empty())
        validation.warnings_.emplace_back("발행처 정보가 없습니다");
    if (book_info.kdc_.empty())
        validation.warnings_.emplace_back("KDC 분류코드가 없습니다");

    return validation;
}


namespace {


BibliographicLevel CategoryToBibliographicLevel(const std::string &category) {
    if (category == "serial")
        return BibliographicLevel::SERIAL;
    if (category == "academic")
        return BibliographicLevel::MONOGRAPHIC_COMPONENT_PART;
    if (category == "comic")
        return BibliographicLevel::COLLECTION;
    return BibliographicLevel::MONOGRAPH_OR_ITEM;
}


// The 40 positions of the fixed-length data elements.
std::string Generate008(const BookInfo &book_info, const time_t now) {
    const std::string date1(book_info.pub_year_.length() >= 4 ? book_info.pub_year_.substr(0, 4)
                                                                : TimeUtil::TimeTToString(now, "%Y"));
    const char type_code(book_info.category_ == "serial" ? 's' : 'a');
    std::string field_008(TimeUtil::TimeTToString(now, "%y%m%d") + "s" + date1 + "    kor  " + type_code);
    field_008.resize(40, ' ');
    return field_008;
}


} // unnamed namespace


Record RecordBuilder::build(const BookInfo &book_info, const time_t now) {
    const Leader leader(714, RecordStatus::INCREASE_IN_ENCODING_LEVEL, TypeOfRecord::LANGUAGE_MATERIAL,
                        CategoryToBibliographicLevel(book_info.category_), 'm', 'a', 2, 2, 205, ' ', ' ', ' ', "4500");

    const std::vector<ControlField> control_fields{
        ControlField("001", StringUtil::PadLeading(std::to_string(next_control_number_++), 12, '0')),
        ControlField("003", "NLK"),
        ControlField("005", TimeUtil::TimeTToString(now, "%Y%m%d%H%M%S") + ".0"),
        ControlField("008", Generate008(book_info, now)),
    };

    std::vector<DataField> data_fields{
        DataField("040", ' ', ' ',
                  { Subfield('a', "NLK"), Subfield('b', "kor"), Subfield('c', "(NLK)"), Subfield('d', "NLK"), Subfield('e', "KORMARC2014") }),
        DataField("020", ' ', ' ', { Subfield('a', book_info.isbn_) }),
    };
    if (not book_info.author_.empty())
        data_fields.emplace_back("100", '1', ' ', std::vector<Subfield>{ Subfield('a', book_info.author_) });
    data_fields.emplace_back("245", '0', ' ', std::vector<Subfield>{ Subfield('a', book_info.title_) });

    std::vector<Subfield> subfields_260;
    if (not book_info.publisher_.empty())
        subfields_260.emplace_back('b', book_info.publisher_);
    if (not book_info.pub_year_.empty())
        subfields_260.emplace_back('c', "c" + book_info.pub_year_);
    if (not subfields_260.empty())
        data_fields.emplace_back("260", ' ', ' ', subfields_260);

    if (book_info.pages_ and *book_info.pages_ > 0)
        data_fields.emplace_back("300", ' ', ' ', std::vector<Subfield>{ Subfield('a', std::to_string(*book_info.pages_) + "p") });

    if (not book_info.kdc_.empty()) {
        data_fields.emplace_back("082", '0', '4', std::vector<Subfield>{ Subfield('a', book_info.kdc_) });
        if (StringUtil::IsDigit(book_info.kdc_[0]))
            data_fields.emplace_back("650", ' ', '8', std::vector<Subfield>{ Subfield('a', GetKDCCategoryName(book_info.kdc_)) });
    }

    return Record(leader, control_fields, data_fields);
}


std::string RecordBuilder::CategoryToTOONType(const std::string &category) {
    if (category == "serial" or category == "academic" or category == "comic")
        return "kormarc_" + category;
    return "kormarc_book";
}


std::pair<Record, std::string> RecordBuilder::buildWithTOON(const BookInfo &book_info) {
    const Record record(build(book_info));
    return std::make_pair(record, TOON::Generate(CategoryToTOONType(book_info.category_)));
}


nlohmann::json RecordBuilder::buildTOONJson(const BookInfo &book_info) {
    const auto record_and_toon_id(buildWithTOON(book_info));
    nlohmann::json toon_json(TOON::ToJson(record_and_toon_id.first, record_and_toon_id.second, record_and_toon_id.first.toMarcXml()));
    toon_json["isbn"] = NormaliseISBN(book_info.isbn_);
    return toon_json;
}


} // namespace KORMARC
