/** \file   StringUtilTests.cc
 *  \brief  Test cases for the StringUtil functions.
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
#define BOOST_TEST_MODULE StringUtil
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "StringUtil.h"


BOOST_AUTO_TEST_CASE(Trim) {
    BOOST_CHECK_EQUAL(StringUtil::TrimWhite("  \t245 00\r\n"), "245 00");
    BOOST_CHECK_EQUAL(StringUtil::Trim("--abc--", "-"), "abc");
    BOOST_CHECK_EQUAL(StringUtil::TrimWhite("   "), "");
}


BOOST_AUTO_TEST_CASE(ToUnsigned) {
    unsigned n;
    BOOST_CHECK(StringUtil::ToUnsigned("714", &n));
    BOOST_CHECK_EQUAL(n, 714u);
    BOOST_CHECK(not StringUtil::ToUnsigned("", &n));
    BOOST_CHECK(not StringUtil::ToUnsigned("-1", &n));
    BOOST_CHECK(not StringUtil::ToUnsigned(" 1", &n));
    BOOST_CHECK(not StringUtil::ToUnsigned("12a", &n));
    BOOST_CHECK(not StringUtil::ToUnsigned("99999999999", &n));
    BOOST_CHECK_THROW(StringUtil::ToUnsigned("x"), std::runtime_error);
    BOOST_CHECK(StringUtil::IsUnsignedNumber("00205"));
    BOOST_CHECK(not StringUtil::IsUnsignedNumber(""));
}


BOOST_AUTO_TEST_CASE(PadLeading) {
    BOOST_CHECK_EQUAL(StringUtil::PadLeading("100000", 12, '0'), "000000100000");
    BOOST_CHECK_EQUAL(StringUtil::PadLeading("12345", 3, '0'), "12345");
}


BOOST_AUTO_TEST_CASE(CaseConversion) {
    BOOST_CHECK_EQUAL(StringUtil::ASCIIToLower("KORMARC_Book"), "kormarc_book");
    BOOST_CHECK_EQUAL(StringUtil::ASCIIToUpper("01hq3k"), "01HQ3K");
    BOOST_CHECK_EQUAL(StringUtil::ASCIIToUpper("표제a"), "표제A");
}


BOOST_AUTO_TEST_CASE(RemoveChars) {
    std::string isbn("978-89 374-6044-9");
    BOOST_CHECK_EQUAL(StringUtil::RemoveChars("- ", &isbn), "9788937460449");
}


BOOST_AUTO_TEST_CASE(IsValidUTF8) {
    BOOST_CHECK(StringUtil::IsValidUTF8("한강 소년이 온다"));
    BOOST_CHECK(StringUtil::IsValidUTF8(""));
    BOOST_CHECK(not StringUtil::IsValidUTF8("\xED\x95"));         // truncated
    BOOST_CHECK(not StringUtil::IsValidUTF8("\xC0\xAF"));         // overlong
    BOOST_CHECK(not StringUtil::IsValidUTF8("\xED\xA0\x80"));     // surrogate
    BOOST_CHECK(not StringUtil::IsValidUTF8("\xFF"));
}


BOOST_AUTO_TEST_CASE(SplitAndJoin) {
    std::vector<std::string> tiers;
    BOOST_CHECK_EQUAL(StringUtil::SplitThenTrimWhite(" 1, 2,,3 ", ',', &tiers), 3u);
    BOOST_CHECK(tiers == (std::vector<std::string>{ "1", "2", "3" }));
    BOOST_CHECK_EQUAL(StringUtil::Join(tiers, ","), "1,2,3");

    std::vector<std::string> subfields;
    BOOST_CHECK_EQUAL(StringUtil::SplitThenTrimWhite("|aTitle||b ", '|', &subfields, /* suppress_empty_words = */ false), 4u);
    BOOST_CHECK(subfields == (std::vector<std::string>{ "", "aTitle", "", "b" }));
}
