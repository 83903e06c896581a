/** \file   StringUtil.cc
 *  \brief  Implementation of string utility functions.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "StringUtil.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>


namespace StringUtil {


std::string &Trim(const std::string &trim_set, std::string * const s) {
    const auto first_non_trim_pos(s->find_first_not_of(trim_set));
    if (first_non_trim_pos == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last_non_trim_pos(s->find_last_not_of(trim_set));
    *s = s->substr(first_non_trim_pos, last_non_trim_pos - first_non_trim_pos + 1);
    return *s;
}


bool IsUnsignedNumber(const std::string &s) {
    if (s.empty())
        return false;

    for (const char ch : s) {
        if (not IsDigit(ch))
            return false;
    }

    return true;
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    uint64_t n64;
    if (not ToUInt64T(s, &n64, base) or n64 > std::numeric_limits<unsigned>::max())
        return false;

    *n = static_cast<unsigned>(n64);
    return true;
}


unsigned ToUnsigned(const std::string &s, const unsigned base) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\" to an unsigned number!");
    return n;
}


bool ToUInt64T(const std::string &s, uint64_t * const n, const unsigned base) {
    if (s.empty() or s[0] == '-' or s[0] == '+' or WHITE_SPACE.find(s[0]) != std::string::npos)
        return false;

    errno = 0;
    char *endp;
    const unsigned long long value(std::strtoull(s.c_str(), &endp, static_cast<int>(base)));
    if (errno != 0 or *endp != '\0') {
        errno = 0;
        return false;
    }

    *n = static_cast<uint64_t>(value);
    return true;
}


std::string ToString(const double n, const unsigned precision) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", static_cast<int>(precision), n);
    return buffer;
}


std::string PadLeading(const std::string &s, const std::string::size_type min_length, const char pad_char) {
    if (s.length() >= min_length)
        return s;
    return std::string(min_length - s.length(), pad_char) + s;
}


std::string &ASCIIToLower(std::string * const s) {
    for (auto &ch : *s) {
        if (ch >= 'A' and ch <= 'Z')
            ch = ch - 'A' + 'a';
    }
    return *s;
}


std::string &ASCIIToUpper(std::string * const s) {
    for (auto &ch : *s) {
        if (ch >= 'a' and ch <= 'z')
            ch = ch - 'a' + 'A';
    }
    return *s;
}


std::string &RemoveChars(const std::string &remove_set, std::string * const s) {
    s->erase(std::remove_if(s->begin(), s->end(),
                            [&remove_set](const char ch) { return remove_set.find(ch) != std::string::npos; }),
             s->end());
    return *s;
}


bool IsValidUTF8(const std::string &s) {
    const auto end(s.cend());
    for (auto ch(s.cbegin()); ch != end; ++ch) {
        const unsigned char lead(static_cast<unsigned char>(*ch));
        if (lead < 0x80u)
            continue;

        unsigned continuation_count;
        uint32_t code_point;
        if ((lead & 0xE0u) == 0xC0u) {
            continuation_count = 1;
            code_point = lead & 0x1Fu;
        } else if ((lead & 0xF0u) == 0xE0u) {
            continuation_count = 2;
            code_point = lead & 0x0Fu;
        } else if ((lead & 0xF8u) == 0xF0u) {
            continuation_count = 3;
            code_point = lead & 0x07u;
        } else
            return false;

        for (unsigned i(0); i < continuation_count; ++i) {
            ++ch;
            if (ch == end)
                return false;
            const unsigned char continuation(static_cast<unsigned char>(*ch));
            if ((continuation & 0xC0u) != 0x80u)
                return false;
            code_point = (code_point << 6u) | (continuation & 0x3Fu);
        }

        // Overlong encodings, surrogates and values past the Unicode range:
        if ((continuation_count == 1 and code_point < 0x80u) or (continuation_count == 2 and code_point < 0x800u)
            or (continuation_count == 3 and code_point < 0x10000u))
            return false;
        if ((code_point >= 0xD800u and code_point <= 0xDFFFu) or code_point > 0x10FFFFu)
            return false;
    }

    return true;
}


} // namespace StringUtil
