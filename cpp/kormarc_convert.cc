/** \file   kormarc_convert.cc
 *  \brief  Converts a KORMARC record file to JSON, MARCXML or the line format.
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
#include <iostream>
#include <string>
#include <cstdlib>
#include "FileUtil.h"
#include "KORMARCParser.h"
#include "StringUtil.h"
#include "TOON.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--subfield-delimiter=c] --format=(json|xml|line|toon-json) record_file\n"
            "\t\"toon-json\" assigns a new TOON identifier and emits the storage document.");
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    char subfield_delimiter(KORMARC::DEFAULT_SUBFIELD_DELIMITER);
    if (argc > 1 and StringUtil::StartsWith(argv[1], "--subfield-delimiter=")) {
        const std::string delimiter(argv[1] + __builtin_strlen("--subfield-delimiter="));
        if (delimiter.length() != 1)
            LOG_ERROR("the subfield delimiter must be a single character!");
        subfield_delimiter = delimiter[0];
        --argc, ++argv;
    }

    if (argc != 3 or not StringUtil::StartsWith(argv[1], "--format="))
        Usage();
    const std::string format(argv[1] + __builtin_strlen("--format="));
    const std::string record_filename(argv[2]);

    const std::string raw_record(FileUtil::ReadStringOrDie(record_filename));
    const KORMARC::Parser parser(subfield_delimiter);
    const KORMARC::Record record(parser.parse(raw_record));

    if (format == "json")
        std::cout << record.toJson().dump(4) << '\n';
    else if (format == "xml")
        std::cout << record.toMarcXml();
    else if (format == "line")
        std::cout << record.toLineFormat(subfield_delimiter);
    else if (format == "toon-json")
        std::cout << TOON::ToJson(record, TOON::Generate(TOON::DetermineRecordType(record)), raw_record).dump(4) << '\n';
    else
        LOG_ERROR("unknown format \"" + format + "\"!");

    return EXIT_SUCCESS;
}
