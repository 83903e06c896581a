/** \file   Base32.cc
 *  \brief  Implementation of Base32 encoding and decoding.
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
#include "Base32.h"
#include <cstdint>
#include "util.h"


namespace Base32 {


std::string Encode(const std::string &binary_data) {
    std::string encoded;
    encoded.reserve((binary_data.size() * 8 + 4) / 5);

    uint32_t buffer(0);
    unsigned bits_left(0);
    for (const char byte : binary_data) {
        buffer = (buffer << 8u) | static_cast<unsigned char>(byte);
        bits_left += 8;
        while (bits_left >= 5) {
            bits_left -= 5;
            encoded += ALPHABET[(buffer >> bits_left) & 0x1Fu];
        }
        buffer &= (1u << bits_left) - 1u;
    }

    if (bits_left > 0)
        encoded += ALPHABET[(buffer << (5 - bits_left)) & 0x1Fu];

    return encoded;
}


namespace {


// \return The 5-bit value of "ch" or -1 if "ch" is not a valid symbol.
int SymbolValue(char ch) {
    if (ch >= 'a' and ch <= 'z')
        ch = ch - 'a' + 'A';
    if (ch == 'I' or ch == 'L')
        ch = '1';
    else if (ch == 'O')
        ch = '0';

    const auto pos(ALPHABET.find(ch));
    return (pos == std::string::npos) ? -1 : static_cast<int>(pos);
}


} // unnamed namespace


std::string Decode(const std::string &encoded) {
    std::string decoded;
    decoded.reserve(encoded.size() * 5 / 8);

    uint32_t buffer(0);
    unsigned bits_left(0);
    for (const char ch : encoded) {
        if (ch == '-' or ch == ' ')
            continue;

        const int value(SymbolValue(ch));
        if (unlikely(value < 0))
            throw DecodeError("in Base32::Decode: invalid Base32 character '" + std::string(1, ch) + "'!");

        buffer = (buffer << 5u) | static_cast<uint32_t>(value);
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            decoded += static_cast<char>((buffer >> bits_left) & 0xFFu);
        }
        buffer &= (1u << bits_left) - 1u;
    }

    return decoded;
}


} // namespace Base32
