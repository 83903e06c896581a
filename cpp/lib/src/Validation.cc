/** \file   Validation.cc
 *  \brief  Implementation of the tiered record validators.
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
#include "Validation.h"
#include <algorithm>
#include <stdexcept>
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "util.h"


namespace Validation {


std::string SeverityToString(const Severity severity) {
    return (severity == Severity::ERROR) ? "ERROR" : "WARNING";
}


namespace {


inline nlohmann::json NullIfEmpty(const std::string &s) {
    return s.empty() ? nlohmann::json(nullptr) : nlohmann::json(s);
}


} // unnamed namespace


nlohmann::json Issue::toJson() const {
    nlohmann::json json{ { "field_tag", NullIfEmpty(field_tag_) },
                         { "message", message_ },
                         { "suggestion", NullIfEmpty(suggestion_) } };
    if (severity_ == Severity::ERROR)
        json["severity"] = SeverityToString(severity_);
    return json;
}


bool Issue::operator==(const Issue &rhs) const {
    return severity_ == rhs.severity_ and field_tag_ == rhs.field_tag_ and message_ == rhs.message_
           and suggestion_ == rhs.suggestion_;
}


void Result::addError(const std::string &field_tag, const std::string &message, const std::string &suggestion) {
    errors_.emplace_back(Severity::ERROR, field_tag, message, suggestion);
    passed_ = false;
}


void Result::addWarning(const std::string &field_tag, const std::string &message, const std::string &suggestion) {
    warnings_.emplace_back(Severity::WARNING, field_tag, message, suggestion);
}


nlohmann::json Result::toJson() const {
    nlohmann::json errors(nlohmann::json::array()), warnings(nlohmann::json::array());
    for (const auto &error : errors_)
        errors.push_back(error.toJson());
    for (const auto &warning : warnings_)
        warnings.push_back(warning.toJson());

    return nlohmann::json{ { "tier", tier_ },
                           { "validator_name", validator_name_ },
                           { "passed", passed_ },
                           { "errors", errors },
                           { "warnings", warnings } };
}


Result StructureValidator::validate(const KORMARC::Record &record) const {
    static const ThreadSafeRegexMatcher field_005_matcher("^[0-9]{14}\\.[0-9]$");

    Result result(tier(), getName());

    // The leader has already been checked during construction.

    if (not record.hasControlField("001"))
        result.addError("001", "001 필드는 필수입니다", "제어번호(001) 필드를 추가하세요");

    const KORMARC::ControlField * const field_005(record.getControlField("005"));
    if (field_005 != nullptr and not field_005_matcher.matched(field_005->getData()))
        result.addError("005", "005 필드 형식 오류: YYYYMMDDHHmmss.f 형식이어야 합니다",
                        "현재값: " + field_005->getData() + ", 예시: 20260111120000.0");

    return result;
}


namespace {


struct RequiredField {
    std::string tag_;
    std::string description_;
    bool is_control_field_;
};


const std::vector<RequiredField> REQUIRED_FIELDS{
    { "001", "제어번호", true },
    { "040", "목록작성기관", false },
    { "245", "표제", false },
    { "260", "발행사항", false },
};


} // unnamed namespace


Result SemanticValidator::validateRequiredFields(const KORMARC::Record &record) const {
    Result result(tier(), getName());

    for (const auto &required_field : REQUIRED_FIELDS) {
        const bool present(required_field.is_control_field_ ? record.hasControlField(required_field.tag_)
                                                            : record.hasDataField(required_field.tag_));
        if (not present)
            result.addError(required_field.tag_,
                            "필수 필드 누락: " + required_field.description_ + "(" + required_field.tag_ + ") 필드가 없습니다",
                            required_field.tag_ + " 필드를 추가하세요");
    }

    if (record.getLeader().getTypeOfRecord() == KORMARC::TypeOfRecord::LANGUAGE_MATERIAL and not record.hasDataField("100"))
        result.addWarning("100", "권장 필드 누락: 도서 레코드에는 저자명(100) 필드가 권장됩니다",
                          "100 필드를 추가하는 것을 고려하세요");

    return result;
}


Result SemanticValidator::validateFieldRelationships(const KORMARC::Record &record) const {
    Result result(tier(), getName());

    const KORMARC::DataField * const field_260(record.getFirstDataField("260"));
    if (field_260 != nullptr and not field_260->hasSubfield('c'))
        result.addError("260", "발행사항(260) 필드에는 발행년($c)이 필수입니다", "260 필드에 $c 서브필드를 추가하세요");
    if (record.hasDataField("100") and not record.hasDataField("245"))
        result.addError("100", "저자(100) 필드가 있으면 표제(245) 필드도 필수입니다", "245 필드를 추가하세요");

    return result;
}


Result SemanticValidator::validate(const KORMARC::Record &record) const {
    Result result(validateRequiredFields(record));
    const Result relationship_result(validateFieldRelationships(record));
    for (const auto &error : relationship_result.errors_)
        result.addError(error.field_tag_, error.message_, error.suggestion_);
    for (const auto &warning : relationship_result.warnings_)
        result.addWarning(warning.field_tag_, warning.message_, warning.suggestion_);

    return result;
}


InstitutionPolicy::InstitutionPolicy()
    : validator_name_("NowonValidator"), institution_group_("노원구"), required_040_subfield_codes_("acd"),
      known_institutions_{ { "211032", "노원정보도서관" }, { "211033", "노원어린이도서관" }, { "211034", "노원청소년도서관" } }
{
}


bool InstitutionPolicy::isKnownInstitution(const std::string &code) const {
    return std::find_if(known_institutions_.cbegin(), known_institutions_.cend(),
                        [&code](const std::pair<std::string, std::string> &code_and_name) { return code_and_name.first == code; })
           != known_institutions_.cend();
}


Result InstitutionPolicyValidator::validate(const KORMARC::Record &record) const {
    Result result(tier(), getName());

    const KORMARC::DataField * const field_040(record.getFirstDataField("040"));
    if (field_040 == nullptr) {
        result.addError("040", "040 필드(목록작성기관)는 필수입니다", "040 필드를 추가하세요");
        return result;
    }

    for (const char required_code : policy_.required_040_subfield_codes_) {
        if (not field_040->hasSubfield(required_code))
            result.addError("040", "040 필드에 서브필드 $" + std::string(1, required_code) + "가 필요합니다",
                            "서브필드 $" + std::string(1, required_code) + "를 추가하세요");
    }

    if (field_040->hasSubfield('a')) {
        const std::string institution_code(field_040->getFirstSubfieldValue('a'));
        if (not policy_.isKnownInstitution(institution_code)) {
            std::vector<std::string> known_codes;
            for (const auto &code_and_name : policy_.known_institutions_)
                known_codes.emplace_back(code_and_name.first);
            result.addWarning("040", policy_.institution_group_ + " 도서관 기관코드가 아닙니다: " + institution_code,
                              policy_.institution_group_ + " 기관코드 사용을 권장합니다: " + StringUtil::Join(known_codes, ", "));
        }
    }

    return result;
}


std::unique_ptr<Validator> CreateValidator(const unsigned tier, const InstitutionPolicy &policy) {
    switch (tier) {
    case 1:
        return std::unique_ptr<Validator>(new StructureValidator());
    case 2:
        return std::unique_ptr<Validator>(new SemanticValidator());
    case 3:
        return std::unique_ptr<Validator>(new InstitutionPolicyValidator(policy));
    default:
        throw std::runtime_error("in Validation::CreateValidator: unknown validation tier " + std::to_string(tier) + "!");
    }
}


} // namespace Validation
