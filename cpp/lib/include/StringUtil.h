/** \file   StringUtil.h
 *  \brief  String utility functions.
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
#pragma once


#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstring>
#include "util.h"


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string &Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


// \return True if "ch" is an ASCII digit.
inline bool IsDigit(const char ch) {
    return ch >= '0' and ch <= '9';
}


// \return True if "s" is non-empty and consists of ASCII digits only.
bool IsUnsignedNumber(const std::string &s);


/** \brief  Converts a string to an unsigned number.
 *  \return True if the conversion succeeded, else false.
 *  \note   Leading or trailing whitespace and signs are not accepted.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


// \throws std::runtime_error if "s" can't be converted.
unsigned ToUnsigned(const std::string &s, const unsigned base = 10);


bool ToUInt64T(const std::string &s, uint64_t * const n, const unsigned base = 10);


// \brief Converts "n" to a string with exactly "precision" digits after the decimal point.
std::string ToString(const double n, const unsigned precision = 2);


/** \brief Left-pads "s" with "pad_char" until it has a length of at least "min_length". */
std::string PadLeading(const std::string &s, const std::string::size_type min_length, const char pad_char = ' ');


inline bool StartsWith(const std::string &s, const std::string &prefix) {
    return s.length() >= prefix.length() and s.compare(0, prefix.length(), prefix) == 0;
}


// Only converts ASCII letters, UTF-8 multibyte sequences are left alone.
std::string &ASCIIToLower(std::string * const s);
inline std::string ASCIIToLower(const std::string &s) {
    std::string temp_s(s);
    return ASCIIToLower(&temp_s);
}


std::string &ASCIIToUpper(std::string * const s);
inline std::string ASCIIToUpper(const std::string &s) {
    std::string temp_s(s);
    return ASCIIToUpper(&temp_s);
}


/** \brief Removes all occurrences of any of the characters in "remove_set" from "s".
 *  \return "*s" after the removal.
 */
std::string &RemoveChars(const std::string &remove_set, std::string * const s);


// \return True if "s" is a sequence of well-formed UTF-8 characters (no overlong encodings or surrogates).
bool IsValidUTF8(const std::string &s);


/** \brief  Split a string around a delimiter, then trim the component substrings.
 *  \param  s                     The string to split.
 *  \param  field_separator       A delimiter character to split around.
 *  \param  trim_chars            A set of characters to trim from each resulting substring.
 *  \param  container             A string container to hold the parts (e.g. std::vector<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> inline unsigned SplitThenTrim(const std::string &s, const char field_separator,
                                                                     const std::string &trim_chars, InsertableContainer * const container,
                                                                     const bool suppress_empty_words = true)
{
    container->clear();
    unsigned count(0);
    std::string::size_type word_start(0);
    for (;;) {
        const auto separator_pos(s.find(field_separator, word_start));
        std::string new_word(s.substr(word_start, separator_pos == std::string::npos ? std::string::npos : separator_pos - word_start));
        Trim(trim_chars, &new_word);
        if (not new_word.empty() or not suppress_empty_words) {
            container->insert(container->end(), new_word);
            ++count;
        }

        if (separator_pos == std::string::npos)
            return count;
        word_start = separator_pos + 1;
    }
}


template<typename InsertableContainer> inline unsigned SplitThenTrimWhite(const std::string &s, const char field_separator,
                                                                          InsertableContainer * const container,
                                                                          const bool suppress_empty_words = true)
{
    return SplitThenTrim(s, field_separator, WHITE_SPACE, container, suppress_empty_words);
}


/** \brief  Join a list of words to form a single string and return that string.
 *  \param  source     The container of words to join.
 *  \param  separator  The text to insert between words.
 */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    bool first(true);
    for (const auto &word : source) {
        if (first)
            first = false;
        else
            dest += separator;
        dest += word;
    }

    return dest;
}


} // namespace StringUtil
