/** \file   KORMARCBuilderTests.cc
 *  \brief  Test cases for the KORMARC record builder and the book metadata checks.
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
#define BOOST_TEST_MODULE KORMARCBuilder
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <cstdlib>
#include <ctime>
#include "KORMARCBuilder.h"
#include "KORMARCParser.h"
#include "StringUtil.h"
#include "TOON.h"
#include "TimeUtil.h"
#include "Validation.h"


using namespace KORMARC;


namespace {


const time_t NOW(1736596800); // 2025-01-11 12:00:00 UTC


struct UTCTimeZone {
    UTCTimeZone() {
        ::setenv("TZ", "UTC", 1);
        ::tzset();
    }
};


BookInfo CreateBookInfo() {
    BookInfo book_info("978-89-374-6044-9", "소년이 온다");
    book_info.author_ = "한강";
    book_info.publisher_ = "창비";
    book_info.pub_year_ = "2024";
    book_info.pages_ = 215;
    book_info.kdc_ = "813";
    book_info.price_ = 15000;
    return book_info;
}


bool ContainsMessage(const std::vector<std::string> &messages, const std::string &message) {
    for (const auto &candidate : messages) {
        if (candidate == message)
            return true;
    }
    return false;
}


} // unnamed namespace


BOOST_GLOBAL_FIXTURE(UTCTimeZone);


BOOST_AUTO_TEST_CASE(NormaliseISBNTest) {
    BOOST_CHECK_EQUAL(KORMARC::NormaliseISBN("978-89-374 6044-9"), "9788937460449");
    BOOST_CHECK_EQUAL(KORMARC::NormaliseISBN(""), "");
}


BOOST_AUTO_TEST_CASE(ValidISBNs) {
    BOOST_CHECK(ValidateISBN("9788937460449").isValid());
    BOOST_CHECK(ValidateISBN("978-89-374-6044-9").isValid());
    BOOST_CHECK(ValidateISBN("0306406152").isValid());
    BOOST_CHECK(ValidateISBN("0-8044-2957-X").isValid());
    BOOST_CHECK(ValidateISBN("080442957x").isValid());
}


BOOST_AUTO_TEST_CASE(InvalidISBNs) {
    BookInfoValidation validation(ValidateISBN("12345"));
    BOOST_REQUIRE_EQUAL(validation.errors_.size(), 1u);
    BOOST_CHECK_EQUAL(validation.errors_[0], "ISBN 길이 오류: 5자리 (10 또는 13자리 필요)");

    BOOST_CHECK_EQUAL(ValidateISBN("9788937460448").errors_.at(0), "ISBN-13 체크섬 오류");
    BOOST_CHECK_EQUAL(ValidateISBN("978893746044X").errors_.at(0), "ISBN-13 형식 오류");
    BOOST_CHECK_EQUAL(ValidateISBN("0306406153").errors_.at(0), "ISBN-10 체크섬 오류");
    BOOST_CHECK_EQUAL(ValidateISBN("030640615A").errors_.at(0), "ISBN-10 형식 오류");
    BOOST_CHECK_EQUAL(ValidateISBN("X306406152").errors_.at(0), "ISBN-10 형식 오류");
    BOOST_CHECK_EQUAL(ValidateISBN("").errors_.at(0), "ISBN 길이 오류: 0자리 (10 또는 13자리 필요)");
}


BOOST_AUTO_TEST_CASE(KDC) {
    BOOST_CHECK(ValidateKDC("8").isValid());
    BOOST_CHECK(ValidateKDC("813").isValid());
    BOOST_CHECK_EQUAL(ValidateKDC("").errors_.at(0), "KDC 분류코드가 비어있습니다");
    BOOST_CHECK_EQUAL(ValidateKDC("8130").errors_.at(0), "KDC 형식 오류: 8130 (0-9로 시작, 최대 3자리 숫자)");
    BOOST_CHECK_EQUAL(ValidateKDC("A13").errors_.size(), 1u);

    BOOST_CHECK_EQUAL(GetKDCCategoryName("000"), "총류");
    BOOST_CHECK_EQUAL(GetKDCCategoryName("813.7"), "문학");
    BOOST_CHECK_EQUAL(GetKDCCategoryName("911"), "역사");
    BOOST_CHECK_EQUAL(GetKDCCategoryName(""), "알 수 없음");
    BOOST_CHECK_EQUAL(GetKDCCategoryName("X"), "알 수 없음");
}


BOOST_AUTO_TEST_CASE(PublicationYear) {
    BOOST_CHECK(ValidatePublicationYear("2024", 2026).isValid());
    BOOST_CHECK(ValidatePublicationYear("202403", 2026).isValid());
    BOOST_CHECK(ValidatePublicationYear("1900", 2026).isValid());
    BOOST_CHECK(ValidatePublicationYear("2031", 2026).isValid());
    BOOST_CHECK_EQUAL(ValidatePublicationYear("2032", 2026).errors_.at(0), "발행년 범위 오류: 2032 (1900-2031 범위 필요)");
    BOOST_CHECK_EQUAL(ValidatePublicationYear("1899", 2026).errors_.at(0), "발행년 범위 오류: 1899 (1900-2031 범위 필요)");
    BOOST_CHECK_EQUAL(ValidatePublicationYear("24", 2026).errors_.at(0), "발행년 형식 오류: 24 (YYYY 또는 YYYYMM 형식 필요)");
    BOOST_CHECK_EQUAL(ValidatePublicationYear("20245", 2026).errors_.size(), 1u);
}


BOOST_AUTO_TEST_CASE(Category) {
    for (const std::string category : { "book", "serial", "academic", "comic" })
        BOOST_CHECK(ValidateCategory(category).isValid());
    BOOST_CHECK_EQUAL(ValidateCategory("magazine").errors_.at(0),
                      "유효하지 않은 카테고리: magazine (유효한 카테고리: book, serial, academic, comic)");
}


BOOST_AUTO_TEST_CASE(BookInfoWarnings) {
    BOOST_CHECK(ValidateBookInfo(CreateBookInfo()).isValid());
    BOOST_CHECK(ValidateBookInfo(CreateBookInfo()).warnings_.empty());

    const BookInfo minimal_book_info("9788937460449", "표제");
    const BookInfoValidation validation(ValidateBookInfo(minimal_book_info));
    BOOST_CHECK(validation.isValid());
    BOOST_CHECK_EQUAL(validation.warnings_.size(), 2u);
    BOOST_CHECK(ContainsMessage(validation.warnings_, "발행처 정보가 없습니다"));
    BOOST_CHECK(ContainsMessage(validation.warnings_, "KDC 분류코드가 없습니다"));

    BookInfo bad_book_info(CreateBookInfo());
    bad_book_info.isbn_ = "";
    bad_book_info.pages_ = 0;
    bad_book_info.category_ = "magazine";
    const BookInfoValidation bad_validation(ValidateBookInfo(bad_book_info));
    BOOST_CHECK(not bad_validation.isValid());
    BOOST_CHECK_EQUAL(bad_validation.errors_.size(), 3u);
    BOOST_CHECK(ContainsMessage(bad_validation.warnings_, "ISBN이 없습니다 (권장)"));
}


BOOST_AUTO_TEST_CASE(BuildFullRecord) {
    RecordBuilder builder;
    const Record record(builder.build(CreateBookInfo(), NOW));

    BOOST_CHECK_EQUAL(record.getLeader().toString(), "00714aamma2200205   4500");
    BOOST_CHECK_EQUAL(record.getControlNumber(), "000000100000");
    BOOST_CHECK_EQUAL(record.getControlField("003")->getData(), "NLK");
    BOOST_CHECK_EQUAL(record.getControlField("005")->getData(), "20250111120000.0");

    const std::string field_008(record.getControlField("008")->getData());
    BOOST_CHECK_EQUAL(field_008.length(), 40u);
    BOOST_CHECK_EQUAL(StringUtil::TrimWhite(field_008), "250111s2024    kor  a");

    std::string tags;
    for (const auto &data_field : record.getDataFields())
        tags += data_field.getTag().toString() + " ";
    BOOST_CHECK_EQUAL(tags, "040 020 100 245 260 300 082 650 ");

    const DataField &field_040(*record.getFirstDataField("040"));
    BOOST_CHECK_EQUAL(field_040.getFirstSubfieldValue('a'), "NLK");
    BOOST_CHECK_EQUAL(field_040.getFirstSubfieldValue('e'), "KORMARC2014");
    BOOST_CHECK_EQUAL(record.getFirstDataField("020")->getFirstSubfieldValue('a'), "978-89-374-6044-9");
    BOOST_CHECK_EQUAL(record.getFirstDataField("100")->getIndicator1(), '1');
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getIndicator1(), '0');
    BOOST_CHECK_EQUAL(record.getFirstDataField("260")->getFirstSubfieldValue('b'), "창비");
    BOOST_CHECK_EQUAL(record.getFirstDataField("260")->getFirstSubfieldValue('c'), "c2024");
    BOOST_CHECK_EQUAL(record.getFirstDataField("300")->getFirstSubfieldValue('a'), "215p");
    BOOST_CHECK_EQUAL(record.getFirstDataField("082")->getIndicator1(), '0');
    BOOST_CHECK_EQUAL(record.getFirstDataField("082")->getIndicator2(), '4');
    BOOST_CHECK_EQUAL(record.getFirstDataField("650")->getIndicator2(), '8');
    BOOST_CHECK_EQUAL(record.getFirstDataField("650")->getFirstSubfieldValue('a'), "문학");

    BOOST_CHECK_EQUAL(record.getISBN(), "9788937460449");
}


BOOST_AUTO_TEST_CASE(BuildMinimalRecord) {
    RecordBuilder builder(7);
    const Record record(builder.build(BookInfo("9788937460449", "표제"), NOW));
    BOOST_CHECK_EQUAL(record.getControlNumber(), "000000000007");
    BOOST_CHECK(not record.hasDataField("100"));
    BOOST_CHECK(not record.hasDataField("260"));
    BOOST_CHECK(not record.hasDataField("300"));
    BOOST_CHECK(not record.hasDataField("082"));
    BOOST_CHECK(not record.hasDataField("650"));

    // Without a publication year the year of "now" is used.
    BOOST_CHECK_EQUAL(record.getControlField("008")->getData().substr(6, 5), "s2025");
}


BOOST_AUTO_TEST_CASE(BibliographicLevelByCategory) {
    RecordBuilder builder;
    BookInfo book_info(CreateBookInfo());

    book_info.category_ = "serial";
    const Record serial_record(builder.build(book_info, NOW));
    BOOST_CHECK(serial_record.getLeader().getBibliographicLevel() == BibliographicLevel::SERIAL);
    BOOST_CHECK_EQUAL(StringUtil::TrimWhite(serial_record.getControlField("008")->getData()), "250111s2024    kor  s");

    book_info.category_ = "academic";
    BOOST_CHECK(builder.build(book_info, NOW).getLeader().getBibliographicLevel() == BibliographicLevel::MONOGRAPHIC_COMPONENT_PART);
    book_info.category_ = "comic";
    BOOST_CHECK(builder.build(book_info, NOW).getLeader().getBibliographicLevel() == BibliographicLevel::COLLECTION);
    book_info.category_ = "unknown";
    BOOST_CHECK(builder.build(book_info, NOW).getLeader().getBibliographicLevel() == BibliographicLevel::MONOGRAPH_OR_ITEM);
}


BOOST_AUTO_TEST_CASE(ControlNumbersIncrease) {
    RecordBuilder builder(100000);
    BOOST_CHECK_EQUAL(builder.build(CreateBookInfo()).getControlNumber(), "000000100000");
    BOOST_CHECK_EQUAL(builder.build(CreateBookInfo()).getControlNumber(), "000000100001");

    // Builders don't share their counters.
    RecordBuilder other_builder(100000);
    BOOST_CHECK_EQUAL(other_builder.build(CreateBookInfo()).getControlNumber(), "000000100000");
}


BOOST_AUTO_TEST_CASE(ConcurrentBuildsYieldUniqueControlNumbers) {
    RecordBuilder builder(1);
    std::mutex control_numbers_mutex;
    std::set<std::string> control_numbers;

    std::vector<std::thread> threads;
    for (unsigned thread_no(0); thread_no < 4; ++thread_no) {
        threads.emplace_back([&builder, &control_numbers_mutex, &control_numbers]() {
            for (unsigned i(0); i < 250; ++i) {
                const std::string control_number(builder.build(CreateBookInfo(), NOW).getControlNumber());
                std::lock_guard<std::mutex> control_numbers_mutex_locker(control_numbers_mutex);
                control_numbers.emplace(control_number);
            }
        });
    }
    for (auto &thread : threads)
        thread.join();

    BOOST_CHECK_EQUAL(control_numbers.size(), 1000u);
    BOOST_CHECK_EQUAL(*control_numbers.rbegin(), "000000001000");
}


BOOST_AUTO_TEST_CASE(BuiltRecordsPassTiers1And2) {
    RecordBuilder builder;
    const Record record(builder.build(CreateBookInfo()));
    BOOST_CHECK(Validation::StructureValidator().validate(record).passed_);
    BOOST_CHECK(Validation::SemanticValidator().validate(record).passed_);

    // "NLK" is not one of the default libraries which only results in a warning.
    const Validation::Result tier3_result(Validation::InstitutionPolicyValidator().validate(record));
    BOOST_CHECK(tier3_result.passed_);
    BOOST_CHECK_EQUAL(tier3_result.warnings_.size(), 1u);
}


BOOST_AUTO_TEST_CASE(BuildWithTOON) {
    RecordBuilder builder;
    BookInfo book_info(CreateBookInfo());
    book_info.category_ = "comic";
    const auto record_and_toon_id(builder.buildWithTOON(book_info));
    BOOST_CHECK(TOON::Validate(record_and_toon_id.second));
    BOOST_CHECK_EQUAL(TOON::Parse(record_and_toon_id.second).type_, "kormarc_comic");

    BOOST_CHECK_EQUAL(RecordBuilder::CategoryToTOONType("serial"), "kormarc_serial");
    BOOST_CHECK_EQUAL(RecordBuilder::CategoryToTOONType("book"), "kormarc_book");
    BOOST_CHECK_EQUAL(RecordBuilder::CategoryToTOONType("whatever"), "kormarc_book");
}


BOOST_AUTO_TEST_CASE(BuildTOONJson) {
    RecordBuilder builder;
    const nlohmann::json document(builder.buildTOONJson(CreateBookInfo()));
    BOOST_CHECK(TOON::Validate(document["toon_id"].get<std::string>()));
    BOOST_CHECK_EQUAL(document["type"].get<std::string>(), "kormarc_book");
    BOOST_CHECK_EQUAL(document["isbn"].get<std::string>(), "9788937460449");
    BOOST_CHECK_EQUAL(document["raw_kormarc"].get<std::string>().find("<?xml"), 0u);

    const Record record(Record::FromJson(document["parsed"]));
    BOOST_CHECK_EQUAL(record.getControlNumber(), "000000100000");
    BOOST_CHECK_EQUAL(record.getFirstDataField("650")->getIndicator2(), '8');
}
