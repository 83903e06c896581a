/** \file   BatchValidator.h
 *  \brief  Runs the validation tiers over collections of records and summarises the outcome.
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


#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "KORMARC.h"
#include "Validation.h"


/** \class  BatchValidator
 *  \brief  Applies a set of validators to many records, optionally using several worker threads.
 */
class BatchValidator {
public:
    // The storage collaborator's row shape.
    struct StoredRecord {
        std::string toon_id_;
        std::string parsed_data_; // JSON as produced by KORMARC::Record::toJson() or TOON::ToJson()["parsed"]
    public:
        StoredRecord(const std::string &toon_id, const std::string &parsed_data): toon_id_(toon_id), parsed_data_(parsed_data) { }
    };

    // Per identifier, one result per tier in ascending tier order.
    typedef std::map<std::string, std::vector<Validation::Result>> Results;

    struct Report {
        unsigned total_records_;
        unsigned passed_records_;
        unsigned failed_records_;
        double pass_rate_; // In percent, rounded to 2 decimal places, 0 if there are no records.
        std::map<unsigned, unsigned> errors_by_tier_;
        std::map<unsigned, unsigned> warnings_by_tier_;
    public:
        nlohmann::json toJson() const;

        // A multi-line, human-readable summary.
        std::string toString() const;
    };
private:
    std::vector<std::unique_ptr<Validation::Validator>> validators_;
    unsigned worker_thread_count_;
public:
    /** \param  tiers                The tiers to run, duplicates are ignored.
     *  \param  policy               Used by the tier 3 validator.
     *  \param  worker_thread_count  If greater than 1, records are distributed among that many threads.
     *  \throws std::runtime_error if "tiers" contains an unknown tier.
     */
    explicit BatchValidator(const std::vector<unsigned> &tiers = { 1, 2, 3 },
                            const Validation::InstitutionPolicy &policy = Validation::InstitutionPolicy(),
                            const unsigned worker_thread_count = 1);

    // Runs an arbitrary set of validators in ascending tier order.
    BatchValidator(std::vector<std::unique_ptr<Validation::Validator>> &&validators, const unsigned worker_thread_count);

    std::vector<unsigned> getTiers() const;

    // \return One result per configured tier.
    std::vector<Validation::Result> validateRecord(const KORMARC::Record &record) const;

    /** \brief  Validates records that have already been assigned identifiers.
     *  \note   If an identifier occurs more than once, the results for the last occurrence are reported.
     */
    Results validateAll(const std::vector<std::pair<std::string, KORMARC::Record>> &records) const;

    /** \brief  Reconstructs and validates stored records.
     *  \param  limit  If non-zero, only the first "limit" stored records are considered.
     *  \note   Records that can't be reconstructed are skipped and don't appear in the results.
     */
    Results validateAll(const std::vector<StoredRecord> &stored_records, const size_t limit = 0) const;

    /** \brief  Aggregates "results".
     *  \note   A record passes if all of its results passed.  Errors are only counted for results that did not pass,
     *          warnings are always counted.
     */
    static Report GenerateReport(const Results &results);
private:
    /* Calls "validate_one(index, &toon_id, &results)" for every index in [0, count) and merges the successful calls in
       index order. */
    template<typename ValidateOne> Results fanOut(const size_t count, const ValidateOne &validate_one) const;
};
