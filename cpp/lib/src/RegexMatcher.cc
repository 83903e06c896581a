/** \file   RegexMatcher.cc
 *  \brief  Implementation of the ThreadSafeRegexMatcher class.
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
#include "RegexMatcher.h"
#include <stdexcept>
#include "util.h"


ThreadSafeRegexMatcher::PcreData::~PcreData() {
    if (pcre_extra_ != nullptr)
        ::pcre_free_study(pcre_extra_);
    if (pcre_ != nullptr)
        ::pcre_free(pcre_);
}


ThreadSafeRegexMatcher::MatchResult::MatchResult(const std::string &subject)
    : subject_(subject), matched_(false), match_count_(0), substr_indices_(MAX_SUBSTRING_MATCHES * 3) { }


std::string ThreadSafeRegexMatcher::MatchResult::operator[](const unsigned group) const {
    if (unlikely(group >= match_count_))
        throw std::out_of_range("in ThreadSafeRegexMatcher::MatchResult::operator[]: group(" + std::to_string(group)
                                + ") >= " + std::to_string(match_count_) + "!");

    const int start(substr_indices_[group * 2]), end(substr_indices_[group * 2 + 1]);
    if (start < 0) // An optional group that did not participate in the match.
        return "";
    return subject_.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}


ThreadSafeRegexMatcher::ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options)
    : pattern_(pattern), options_(options), pcre_data_(std::make_shared<PcreData>())
{
    int pcre_options(0);
    if (options_ & ENABLE_UTF8)
        pcre_options |= PCRE_UTF8;
    if (options_ & CASE_INSENSITIVE)
        pcre_options |= PCRE_CASELESS;

    const char *errptr;
    int erroffset;
    pcre_data_->pcre_ = ::pcre_compile(pattern_.c_str(), pcre_options, &errptr, &erroffset, nullptr);
    if (unlikely(pcre_data_->pcre_ == nullptr))
        throw std::runtime_error("in ThreadSafeRegexMatcher::ThreadSafeRegexMatcher: failed to compile \"" + pattern_
                                 + "\" at offset " + std::to_string(erroffset) + ": " + std::string(errptr));

    // No PCRE_STUDY_JIT_COMPILE, the JIT stack is not thread safe.
    pcre_data_->pcre_extra_ = ::pcre_study(pcre_data_->pcre_, 0, &errptr);
    if (unlikely(pcre_data_->pcre_extra_ == nullptr and errptr != nullptr))
        throw std::runtime_error("in ThreadSafeRegexMatcher::ThreadSafeRegexMatcher: failed to study \"" + pattern_ + "\": "
                                 + std::string(errptr));
}


ThreadSafeRegexMatcher::MatchResult ThreadSafeRegexMatcher::match(const std::string &subject) const {
    MatchResult match_result(subject);
    const int retcode(::pcre_exec(pcre_data_->pcre_, pcre_data_->pcre_extra_, subject.data(), static_cast<int>(subject.length()), 0, 0,
                                  &match_result.substr_indices_[0], static_cast<int>(match_result.substr_indices_.size())));
    if (retcode > 0) {
        match_result.matched_ = true;
        match_result.match_count_ = static_cast<unsigned>(retcode);
    } else if (retcode == 0)
        throw std::runtime_error("in ThreadSafeRegexMatcher::match: too many capture groups in \"" + pattern_ + "\"!");
    else if (retcode == PCRE_ERROR_BADUTF8)
        match_result.error_message_ = "invalid UTF-8 in subject";
    else if (retcode != PCRE_ERROR_NOMATCH)
        match_result.error_message_ = "PCRE error " + std::to_string(retcode) + " for pattern \"" + pattern_ + "\"";

    return match_result;
}
