/** \file   KORMARCParserTests.cc
 *  \brief  Test cases for the KORMARC line format parser.
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
#define BOOST_TEST_MODULE KORMARCParser
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <string>
#include <unistd.h>
#include "FileUtil.h"
#include "KORMARCParser.h"
#include "KORMARCSamples.h"
#include "Validation.h"


using namespace KORMARC;


BOOST_AUTO_TEST_CASE(MultiFieldRecord) {
    const Parser parser;
    const Record record(parser.parse(KORMARCSamples::MULTI_FIELD_RECORD));

    BOOST_CHECK_EQUAL(record.getLeader().getRecordLength(), 714u);
    BOOST_REQUIRE_EQUAL(record.getControlFields().size(), 1u);
    BOOST_CHECK_EQUAL(record.getControlFields()[0].getTag(), "001");
    BOOST_CHECK_EQUAL(record.getControlFields()[0].getData(), "1234567890");
    BOOST_REQUIRE_EQUAL(record.getDataFields().size(), 2u);

    const DataField &field_245(record.getDataFields()[0]);
    BOOST_CHECK_EQUAL(field_245.getTag(), "245");
    BOOST_CHECK_EQUAL(field_245.getIndicator1(), '1');
    BOOST_CHECK_EQUAL(field_245.getIndicator2(), '0');
    BOOST_CHECK_EQUAL(field_245.getFirstSubfieldValue('a'), "Title");
    BOOST_CHECK_EQUAL(field_245.getFirstSubfieldValue('b'), "Subtitle");

    const DataField &field_260(record.getDataFields()[1]);
    BOOST_CHECK_EQUAL(field_260.getIndicator1(), ' ');
    BOOST_CHECK_EQUAL(field_260.getIndicator2(), ' ');
    BOOST_CHECK_EQUAL(field_260.getSubfields().size(), 3u);
    BOOST_CHECK_EQUAL(field_260.getFirstSubfieldValue('c'), "2020");

    const Validation::SemanticValidator semantic_validator;
    const Validation::Result relationship_result(semantic_validator.validateFieldRelationships(record));
    BOOST_CHECK(relationship_result.passed_);
    BOOST_CHECK(relationship_result.errors_.empty());

    const Validation::Result tier3_result(Validation::InstitutionPolicyValidator().validate(record));
    BOOST_CHECK(not tier3_result.passed_);
    BOOST_REQUIRE_EQUAL(tier3_result.errors_.size(), 1u);
    BOOST_CHECK_EQUAL(tier3_result.errors_[0].field_tag_, "040");
}


BOOST_AUTO_TEST_CASE(FullRecord) {
    const Record record(Parser().parse(KORMARCSamples::FULL_BOOK_RECORD));
    BOOST_CHECK_EQUAL(record.getControlFields().size(), 4u);
    BOOST_CHECK_EQUAL(record.getDataFields().size(), 7u);
    BOOST_CHECK_EQUAL(record.getControlField("008")->getData(), "240115s2024    ulk           000 f kor");
    BOOST_CHECK_EQUAL(record.getFirstDataField("082")->getFirstSubfieldValue('2'), "6");
    BOOST_CHECK_EQUAL(record.getFirstDataField("100")->getIndicator1(), '1');
    BOOST_CHECK_EQUAL(record.getFirstDataField("100")->getIndicator2(), ' ');
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getFirstSubfieldValue('b'), "한강 장편소설 /");
}


BOOST_AUTO_TEST_CASE(MinimalAndControlFieldsOnlyRecords) {
    const Parser parser;
    const Record minimal_record(parser.parse(KORMARCSamples::MINIMAL_RECORD));
    BOOST_CHECK(minimal_record.getControlFields().empty());
    BOOST_CHECK_EQUAL(minimal_record.getDataFields().size(), 1u);

    const Record control_fields_only_record(parser.parse(KORMARCSamples::CONTROL_FIELDS_ONLY_RECORD));
    BOOST_CHECK_EQUAL(control_fields_only_record.getControlFields().size(), 4u);
    BOOST_CHECK(control_fields_only_record.getDataFields().empty());

    const Record leader_only_record(parser.parse("00714cam  2200205 a 4500\n"));
    BOOST_CHECK(leader_only_record.getControlFields().empty());
    BOOST_CHECK(leader_only_record.getDataFields().empty());
}


BOOST_AUTO_TEST_CASE(RoundTrip) {
    const Parser parser;
    for (const auto &sample : { KORMARCSamples::FULL_BOOK_RECORD, KORMARCSamples::MINIMAL_RECORD,
                                KORMARCSamples::MULTI_FIELD_RECORD, KORMARCSamples::CONTROL_FIELDS_ONLY_RECORD,
                                KORMARCSamples::SERIAL_RECORD, KORMARCSamples::SPECIAL_CHARACTERS_RECORD,
                                KORMARCSamples::ROUND_TRIP_RECORD })
    {
        const Record record(parser.parse(sample));
        const Record reparsed_record(parser.parse(record.toLineFormat()));
        BOOST_CHECK(reparsed_record == record);
        BOOST_CHECK_EQUAL(reparsed_record.toLineFormat(), record.toLineFormat());
    }
}


BOOST_AUTO_TEST_CASE(RoundTripOfFieldsWithoutSubfields) {
    const Parser parser;
    for (const std::string document : { "00714cam  2200205 a 4500\n001 X\n245 10|\n",
                                        "00714cam  2200205 a 4500\n001 X\n245 |\n" })
    {
        const Record record(parser.parse(document));
        BOOST_REQUIRE_EQUAL(record.getDataFields().size(), 1u);
        BOOST_CHECK(record.getDataFields()[0].empty());

        const Record reparsed_record(parser.parse(record.toLineFormat()));
        BOOST_CHECK(reparsed_record == record);
        BOOST_REQUIRE_EQUAL(reparsed_record.getDataFields().size(), 1u);
        BOOST_CHECK(reparsed_record.getDataFields()[0].empty());
    }

    const Record record(parser.parse("00714cam  2200205 a 4500\n001 X\n245 10|\n"));
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getIndicator1(), '1');
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getIndicator2(), '0');
    BOOST_CHECK_EQUAL(record.toLineFormat(), "00714cam  2200205 a 4500\n001 X\n245 10|\n");
    BOOST_CHECK_EQUAL(parser.parse("00714cam  2200205 a 4500\n245 |\n").toLineFormat(), "00714cam  2200205 a 4500\n245   |\n");
}


BOOST_AUTO_TEST_CASE(FieldOrderIsPreserved) {
    const Record record(Parser().parse(KORMARCSamples::ROUND_TRIP_RECORD));
    std::string tags;
    for (const auto &data_field : record.getDataFields())
        tags += data_field.getTag().toString() + " ";
    BOOST_CHECK_EQUAL(tags, "020 040 100 245 260 650 700 ");

    std::string codes;
    for (const auto &subfield : *record.getFirstDataField("245"))
        codes += subfield.getCode();
    BOOST_CHECK_EQUAL(codes, "abc");
}


BOOST_AUTO_TEST_CASE(ShortLeader) {
    try {
        Parser().parse("00714cam  2200205 a 450\n001 123\n");
        BOOST_FAIL("a 23 character leader was accepted");
    } catch (const LeaderParseError &x) {
        BOOST_CHECK_EQUAL(x.getFoundLength(), 23u);
        BOOST_CHECK(x.getMessage().find("24 characters, got 23") != std::string::npos);
    }
}


BOOST_AUTO_TEST_CASE(IllegalLeaderCodes) {
    BOOST_CHECK_THROW(Parser().parse("00714cxm  2200205 a 4500\n"), LeaderParseError);
    BOOST_CHECK_THROW(Parser().parse("00714cxm  2200205 a 4500\n"), ParseError);
}


BOOST_AUTO_TEST_CASE(EmptyInput) {
    BOOST_CHECK_THROW(Parser().parse(""), ParseError);
    BOOST_CHECK_THROW(Parser().parse("\n  \n\t\n"), ParseError);
}


BOOST_AUTO_TEST_CASE(InvalidUTF8) {
    BOOST_CHECK_THROW(Parser().parse("00714cam  2200205 a 4500\n245 10|a\xC3\x28\n"), EncodingError);
    BOOST_CHECK_THROW(Parser().parse("\xFF"), EncodingError);
}


BOOST_AUTO_TEST_CASE(BlankLinesAndSurroundingWhitespace) {
    const Record record(Parser().parse("\n\n  00714cam  2200205 a 4500  \n\n001 123\n\n\t245 10|aTitle  \n\n"));
    BOOST_CHECK_EQUAL(record.getControlNumber(), "123");
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getFirstSubfieldValue('a'), "Title");
}


BOOST_AUTO_TEST_CASE(ShortControlFieldTags) {
    const Record record(Parser().parse("00714cam  2200205 a 4500\n1 123\n05 20260111120000.0\n8 260111s2026\n"));
    BOOST_REQUIRE_EQUAL(record.getControlFields().size(), 3u);
    BOOST_CHECK_EQUAL(record.getControlFields()[0].getTag(), "001");
    BOOST_CHECK_EQUAL(record.getControlFields()[1].getTag(), "005");
    BOOST_CHECK_EQUAL(record.getControlFields()[2].getTag(), "008");
    BOOST_CHECK_EQUAL(record.getControlFields()[2].getData(), "260111s2026");
}


BOOST_AUTO_TEST_CASE(ControlFieldContentIsKept) {
    const Record record(Parser().parse("00714cam  2200205 a 4500\n008 200101s2020    ko a |b x\n"));
    BOOST_CHECK_EQUAL(record.getControlField("008")->getData(), "200101s2020    ko a |b x");
}


BOOST_AUTO_TEST_CASE(ImplicitSubfieldA) {
    const Record record(Parser().parse("00714cam  2200205 a 4500\n500 Just a note\n"));
    const DataField &field_500(record.getDataFields()[0]);
    BOOST_CHECK_EQUAL(field_500.getIndicator1(), ' ');
    BOOST_CHECK_EQUAL(field_500.getIndicator2(), ' ');
    BOOST_REQUIRE_EQUAL(field_500.getSubfields().size(), 1u);
    BOOST_CHECK_EQUAL(field_500.getSubfields()[0].getCode(), 'a');
    BOOST_CHECK_EQUAL(field_500.getSubfields()[0].getData(), "Just a note");
}


BOOST_AUTO_TEST_CASE(Indicators) {
    const Parser parser;
    const DataField one_indicator(parser.parseDataField("100", "1|aName"));
    BOOST_CHECK_EQUAL(one_indicator.getIndicator1(), '1');
    BOOST_CHECK_EQUAL(one_indicator.getIndicator2(), ' ');

    const DataField three_digits(parser.parseDataField("245", "104|aTitle"));
    BOOST_CHECK_EQUAL(three_digits.getIndicator1(), '1');
    BOOST_CHECK_EQUAL(three_digits.getIndicator2(), '0');

    const DataField letters_before_delimiter(parser.parseDataField("245", "ab|aTitle"));
    BOOST_CHECK_EQUAL(letters_before_delimiter.getIndicator1(), ' ');
    BOOST_CHECK_EQUAL(letters_before_delimiter.getIndicator2(), ' ');
    BOOST_CHECK_EQUAL(letters_before_delimiter.getFirstSubfieldValue('a'), "Title");
}


BOOST_AUTO_TEST_CASE(EmptySubfieldChunksAreDropped) {
    const DataField field(Parser().parseDataField("245", "10|aTitle||  |bSub"));
    BOOST_REQUIRE_EQUAL(field.getSubfields().size(), 2u);
    BOOST_CHECK_EQUAL(field.getSubfields()[1].getCode(), 'b');
    BOOST_CHECK_EQUAL(field.getSubfields()[1].getData(), "Sub");

    const DataField code_only(Parser().parseDataField("245", "10|a"));
    BOOST_REQUIRE_EQUAL(code_only.getSubfields().size(), 1u);
    BOOST_CHECK_EQUAL(code_only.getSubfields()[0].getData(), "");
}


BOOST_AUTO_TEST_CASE(NonASCIISubfieldCode) {
    BOOST_CHECK_THROW(Parser().parseDataField("245", "10|한글"), FieldValidationError);
    try {
        Parser().parse("00714cam  2200205 a 4500\n245 10|한글\n");
        BOOST_FAIL("a non-ASCII subfield code was accepted");
    } catch (const FieldParseError &x) {
        BOOST_CHECK_EQUAL(x.getTag(), "245");
    }
}


BOOST_AUTO_TEST_CASE(CustomDelimiter) {
    const Parser parser('$');
    BOOST_CHECK_EQUAL(parser.getSubfieldDelimiter(), '$');
    const Record record(parser.parse("00714cam  2200205 a 4500\n245 10$aTitle|with pipe$bSubtitle\n"));
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getFirstSubfieldValue('a'), "Title|with pipe");
    BOOST_CHECK_EQUAL(record.getFirstDataField("245")->getFirstSubfieldValue('b'), "Subtitle");
}


BOOST_AUTO_TEST_CASE(TagOutOfRange) {
    try {
        Parser().parse("00714cam  2200205 a 4500\n1000 |aToo long\n");
        BOOST_FAIL("a four digit data field tag was accepted");
    } catch (const FieldParseError &x) {
        BOOST_CHECK_EQUAL(x.getTag(), "1000");
    }

    BOOST_CHECK_THROW(Parser().parse("00714cam  2200205 a 4500\nAB |aTitle\n"), FieldParseError);
}


BOOST_AUTO_TEST_CASE(TagOnlyLines) {
    const std::string text("00714cam  2200205 a 4500\n001 123\n245\n260  |c2020\n");
    const Record record(Parser().parse(text));
    BOOST_CHECK(not record.hasDataField("245"));
    BOOST_CHECK(record.hasDataField("260"));

    const Parser strict_parser(DEFAULT_SUBFIELD_DELIMITER, /* strict = */ true);
    BOOST_CHECK(strict_parser.isStrict());
    BOOST_CHECK_THROW(strict_parser.parse(text), FieldParseError);
}


BOOST_AUTO_TEST_CASE(ParseFile) {
    char path_template[] = "/tmp/KORMARCParserTestsXXXXXX";
    const int fd(::mkstemp(path_template));
    BOOST_REQUIRE(fd != -1);
    ::close(fd);

    const std::string path(path_template);
    BOOST_REQUIRE(FileUtil::WriteString(path, KORMARCSamples::SERIAL_RECORD));
    const Record record(Parser().parseFile(path));
    BOOST_CHECK_EQUAL(record.getControlNumber(), "KSE000000042");
    ::unlink(path.c_str());

    try {
        Parser().parseFile("/nonexistent/record.kormarc");
        BOOST_FAIL("parsing a missing file succeeded");
    } catch (const ParseError &x) {
        BOOST_CHECK_EQUAL(x.getContext().at(0).second, "/nonexistent/record.kormarc");
    }
}
