/** \file   KORMARCSamples.h
 *  \brief  Sample records shared by the KORMARC test programs.
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


#include <string>


namespace KORMARCSamples {


// Seven data fields.
const std::string FULL_BOOK_RECORD(
    "00714cam  2200205 a 4500\n"
    "001 KMO202400001\n"
    "003 NLK\n"
    "005 20240115103000.0\n"
    "008 240115s2024    ulk           000 f kor\n"
    "020  |a9788937460449|c15000\n"
    "040  |a211032|bkor|c211032|d211032\n"
    "082 04|a813.7|26\n"
    "100 1 |a한강\n"
    "245 10|a소년이 온다 :|b한강 장편소설 /|d한강 지음\n"
    "260  |a파주 :|b창비,|c2024\n"
    "300  |a215 p. ;|c20 cm\n");


const std::string MINIMAL_RECORD(
    "00714cam  2200205 a 4500\n"
    "245 00|aMinimal\n");


const std::string MULTI_FIELD_RECORD(
    "00714cam  2200205 a 4500\n"
    "001 1234567890\n"
    "245 10|aTitle|bSubtitle\n"
    "260  |aCity|bPublisher|c2020\n");


const std::string CONTROL_FIELDS_ONLY_RECORD(
    "00714cam  2200205 a 4500\n"
    "001 CTRL00000001\n"
    "003 NLK\n"
    "005 20200101000000.0\n"
    "008 200101s2020    ko a     000 0 kor d\n");


const std::string SERIAL_RECORD(
    "00714cas  2200205 a 4500\n"
    "001 KSE000000042\n"
    "005 20231201120000.0\n"
    "008 231201c20009999ulkmr p       0   a0kor\n"
    "040  |a211099|bkor|c211099|d211099\n"
    "245 00|a월간 도서관|n제12호\n"
    "260  |a서울 :|b한국도서관협회,|c2023\n");


const std::string SPECIAL_CHARACTERS_RECORD(
    "00714cam  2200205 a 4500\n"
    "001 SPC000000001\n"
    "245 10|aC++ & <XML> \"quotes\" 'apostrophes'|b日本語・한국어・Ελληνικά\n"
    "500  |a€ 100, © 2024, emoji 📚\n");


const std::string ROUND_TRIP_RECORD(
    "00714cam  2200205 a 4500\n"
    "001 RT0000000001\n"
    "005 20260111120000.0\n"
    "008 260111s2026    ulk           000 f kor\n"
    "020  |a978-89-374-6044-9\n"
    "040  |a211033|bkor|c211033|d211033\n"
    "100 1 |a홍길동\n"
    "245 10|a첫째 표제|b둘째 표제|c홍길동 지음\n"
    "260  |a서울|b출판사|c2026\n"
    "650 08|a문학|x소설\n"
    "700 1 |a김철수|e옮김\n");


} // namespace KORMARCSamples
