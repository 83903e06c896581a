/** \file   kormarc_toon.cc
 *  \brief  Generates, parses and validates TOON identifiers.
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
#include "StringUtil.h"
#include "TOON.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("generate [--timestamp=milliseconds] type_prefix\n"
            "       parse toon_id\n"
            "       validate toon_id\n"
            "\"validate\" exits with a non-zero exit code if the identifier is malformed.");
}


int Generate(int argc, char *argv[]) {
    uint64_t timestamp_ms(0);
    bool have_timestamp(false);
    if (argc == 3 and StringUtil::StartsWith(argv[1], "--timestamp=")) {
        if (not StringUtil::ToUInt64T(argv[1] + __builtin_strlen("--timestamp="), &timestamp_ms))
            LOG_ERROR("bad timestamp \"" + std::string(argv[1]) + "\"!");
        have_timestamp = true;
        --argc, ++argv;
    }
    if (argc != 2)
        Usage();

    std::cout << (have_timestamp ? TOON::Generate(argv[1], timestamp_ms) : TOON::Generate(argv[1])) << '\n';
    return EXIT_SUCCESS;
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 3)
        Usage();

    const std::string command(argv[1]);
    --argc, ++argv;
    if (command == "generate")
        return Generate(argc, argv);

    if (argc != 2)
        Usage();
    if (command == "parse") {
        std::cout << TOON::Parse(argv[1]).toJson().dump(4) << '\n';
        return EXIT_SUCCESS;
    }
    if (command == "validate") {
        const bool valid(TOON::Validate(argv[1]));
        std::cout << (valid ? "valid" : "invalid") << '\n';
        return valid ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    Usage();
}
