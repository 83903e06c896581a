/** \file   Validation.h
 *  \brief  The three-tier rule engine that certifies KORMARC records.
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


#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "KORMARC.h"


/** \namespace Validation
 *  \brief     Record validators organised in tiers.
 *
 *  Tier 1 checks structure, tier 2 checks the presence of required fields and the relationships between fields and
 *  tier 3 applies the cataloguing policy of a specific institution.  Rule violations are reported as data in a
 *  Result and never thrown.
 */
namespace Validation {


enum class Severity { ERROR, WARNING };


std::string SeverityToString(const Severity severity);


/** \brief A single finding.  An empty field tag or suggestion means "not applicable". */
struct Issue {
    Severity severity_;
    std::string field_tag_;
    std::string message_;
    std::string suggestion_;
public:
    Issue(const Severity severity, const std::string &field_tag, const std::string &message, const std::string &suggestion = "")
        : severity_(severity), field_tag_(field_tag), message_(message), suggestion_(suggestion) { }

    // Errors carry a "severity" key, warnings don't.  Empty optional members are rendered as null.
    nlohmann::json toJson() const;

    bool operator==(const Issue &rhs) const;
    inline bool operator!=(const Issue &rhs) const { return not operator==(rhs); }
};


struct Result {
    unsigned tier_;
    std::string validator_name_;
    bool passed_;
    std::vector<Issue> errors_;   // In the order in which the rules were evaluated.
    std::vector<Issue> warnings_; // In the order in which the rules were evaluated.
public:
    Result(const unsigned tier, const std::string &validator_name): tier_(tier), validator_name_(validator_name), passed_(true) { }

    void addError(const std::string &field_tag, const std::string &message, const std::string &suggestion = "");
    void addWarning(const std::string &field_tag, const std::string &message, const std::string &suggestion = "");

    nlohmann::json toJson() const;
};


/** \class  Validator
 *  \brief  Interface of all tiers.
 */
class Validator {
public:
    virtual ~Validator() = default;

    virtual unsigned tier() const = 0;
    virtual std::string getName() const = 0;

    // Never throws for rule violations.  Running it twice on the same record yields identical results.
    virtual Result validate(const KORMARC::Record &record) const = 0;
};


/** Tier 1: a 001 control field must exist and a 005 control field, if present, must look like "YYYYMMDDHHmmss.f". */
class StructureValidator final : public Validator {
public:
    unsigned tier() const override { return 1; }
    std::string getName() const override { return "StructureValidator"; }
    Result validate(const KORMARC::Record &record) const override;
};


/** Tier 2: required fields 001, 040, 245 and 260, 260 must have a $c, 100 requires 245.  Language material without
 *  a 100 field yields a warning.
 */
class SemanticValidator final : public Validator {
public:
    unsigned tier() const override { return 2; }
    std::string getName() const override { return "SemanticValidator"; }

    // The union of the following two, required fields first.
    Result validate(const KORMARC::Record &record) const override;

    Result validateRequiredFields(const KORMARC::Record &record) const;
    Result validateFieldRelationships(const KORMARC::Record &record) const;
};


struct InstitutionPolicy {
    std::string validator_name_;
    std::string institution_group_; // Used in messages, e.g. "노원구".
    std::string required_040_subfield_codes_;
    std::vector<std::pair<std::string, std::string>> known_institutions_; // (code, name) in display order
public:
    // The policy of the public libraries of Seoul's Nowon district.
    InstitutionPolicy();
    InstitutionPolicy(const std::string &validator_name, const std::string &institution_group,
                      const std::string &required_040_subfield_codes,
                      const std::vector<std::pair<std::string, std::string>> &known_institutions)
        : validator_name_(validator_name), institution_group_(institution_group),
          required_040_subfield_codes_(required_040_subfield_codes),
          known_institutions_(known_institutions) { }

    bool isKnownInstitution(const std::string &code) const;
};


/** Tier 3: a 040 field with all of the policy's required subfields must exist.  An unknown institution code in
 *  040$a yields a warning only.
 */
class InstitutionPolicyValidator final : public Validator {
    InstitutionPolicy policy_;
public:
    explicit InstitutionPolicyValidator(const InstitutionPolicy &policy = InstitutionPolicy()): policy_(policy) { }

    unsigned tier() const override { return 3; }
    std::string getName() const override { return policy_.validator_name_; }
    Result validate(const KORMARC::Record &record) const override;
};


/** \brief  Instantiates the validator for "tier".
 *  \throws std::runtime_error if "tier" is not 1, 2 or 3.
 */
std::unique_ptr<Validator> CreateValidator(const unsigned tier, const InstitutionPolicy &policy = InstitutionPolicy());


} // namespace Validation
