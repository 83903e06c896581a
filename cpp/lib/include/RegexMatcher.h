/** \file   RegexMatcher.h
 *  \brief  Thread-safe wrapper around the PCRE library for UTF-8 patterns and subjects.
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


#include <memory>
#include <string>
#include <vector>
#include <pcre.h>


/** \class ThreadSafeRegexMatcher
 *  \brief A compiled PCRE pattern that may be shared between threads.
 *  \note  Copies share the compiled pattern.  Match state lives entirely in the returned MatchResult objects.
 */
class ThreadSafeRegexMatcher {
public:
    class MatchResult {
        friend class ThreadSafeRegexMatcher;

        std::string subject_;
        bool matched_;
        unsigned match_count_;
        std::vector<int> substr_indices_;
        std::string error_message_;
    public:
        explicit MatchResult(const std::string &subject);

        inline operator bool() const { return matched_; }
        inline unsigned size() const { return match_count_; }
        inline const std::string &getErrorMessage() const { return error_message_; }

        // \return The text matched by capture group "group", group 0 being the entire match.
        std::string operator[](const unsigned group) const;
    };

    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2 };
private:
    static constexpr size_t MAX_SUBSTRING_MATCHES = 20;

    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;
    public:
        PcreData(): pcre_(nullptr), pcre_extra_(nullptr) { }
        ~PcreData();
    };

    std::string pattern_;
    unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;
public:
    /** \throws std::runtime_error if "pattern" is not a valid PCRE pattern. */
    explicit ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);

    inline const std::string &getPattern() const { return pattern_; }
    MatchResult match(const std::string &subject) const;

    // \return True if the pattern matched somewhere in "subject".
    inline bool matched(const std::string &subject) const { return static_cast<bool>(match(subject)); }
};
