/** \file   Base32.h
 *  \brief  Crockford-style Base32 encoding and decoding of binary data.
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


#include <stdexcept>
#include <string>


namespace Base32 {


// Digits and upper-case letters except for I, L, O and U.
const std::string ALPHABET("0123456789ABCDEFGHJKMNPQRSTVWXYZ");


class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string &message): std::runtime_error(message) { }
};


/** \brief  Encodes "binary_data" 5 bits at a time, most significant bit first.
 *  \note   A trailing group of fewer than 5 bits is padded with zero bits on the right.
 */
std::string Encode(const std::string &binary_data);


/** \brief  Inverse of Encode().
 *  \note   Letters are accepted in either case, hyphens and blanks are ignored and I and L are read as 1 and O as 0.
 *          Trailing bits that do not form a complete byte are dropped.
 *  \throws DecodeError if "encoded" contains any other character that is not part of ALPHABET.
 */
std::string Decode(const std::string &encoded);


} // namespace Base32
