/** \file   BatchValidator.cc
 *  \brief  Implementation of class BatchValidator.
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
#include "BatchValidator.h"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>
#include <thread>
#include "StringUtil.h"
#include "ThreadUtil.h"
#include "util.h"


nlohmann::json BatchValidator::Report::toJson() const {
    nlohmann::json errors_by_tier(nlohmann::json::object()), warnings_by_tier(nlohmann::json::object());
    for (const auto &tier_and_count : errors_by_tier_)
        errors_by_tier[std::to_string(tier_and_count.first)] = tier_and_count.second;
    for (const auto &tier_and_count : warnings_by_tier_)
        warnings_by_tier[std::to_string(tier_and_count.first)] = tier_and_count.second;

    return nlohmann::json{ { "total_records", total_records_ },
                           { "passed_records", passed_records_ },
                           { "failed_records", failed_records_ },
                           { "pass_rate", pass_rate_ },
                           { "errors_by_tier", errors_by_tier },
                           { "warnings_by_tier", warnings_by_tier } };
}


std::string BatchValidator::Report::toString() const {
    const std::string rule(60, '=');
    std::string report;
    report += rule + "\n";
    report += "KORMARC 배치 검증 보고서\n";
    report += rule + "\n";
    report += "총 레코드 수: " + std::to_string(total_records_) + "\n";
    report += "통과: " + std::to_string(passed_records_) + "\n";
    report += "실패: " + std::to_string(failed_records_) + "\n";
    report += "통과율: " + StringUtil::ToString(pass_rate_, 2) + "%\n";
    report += "\nTier별 오류:\n";
    for (const auto &tier_and_count : errors_by_tier_)
        report += "  Tier " + std::to_string(tier_and_count.first) + ": " + std::to_string(tier_and_count.second) + "개\n";
    report += "\nTier별 경고:\n";
    for (const auto &tier_and_count : warnings_by_tier_)
        report += "  Tier " + std::to_string(tier_and_count.first) + ": " + std::to_string(tier_and_count.second) + "개\n";
    report += rule + "\n";
    return report;
}


BatchValidator::BatchValidator(const std::vector<unsigned> &tiers, const Validation::InstitutionPolicy &policy,
                               const unsigned worker_thread_count)
    : worker_thread_count_(std::max(worker_thread_count, 1u))
{
    const std::set<unsigned> unique_tiers(tiers.cbegin(), tiers.cend());
    for (const unsigned tier : unique_tiers)
        validators_.emplace_back(Validation::CreateValidator(tier, policy));
}


BatchValidator::BatchValidator(std::vector<std::unique_ptr<Validation::Validator>> &&validators, const unsigned worker_thread_count)
    : validators_(std::move(validators)), worker_thread_count_(std::max(worker_thread_count, 1u))
{
    std::stable_sort(validators_.begin(), validators_.end(),
                     [](const std::unique_ptr<Validation::Validator> &lhs, const std::unique_ptr<Validation::Validator> &rhs) {
                         return lhs->tier() < rhs->tier();
                     });
}


std::vector<unsigned> BatchValidator::getTiers() const {
    std::vector<unsigned> tiers;
    for (const auto &validator : validators_)
        tiers.emplace_back(validator->tier());
    return tiers;
}


std::vector<Validation::Result> BatchValidator::validateRecord(const KORMARC::Record &record) const {
    std::vector<Validation::Result> results;
    for (const auto &validator : validators_)
        results.emplace_back(validator->validate(record));
    return results;
}


namespace {


struct IndexedResults {
    size_t index_;
    std::string toon_id_;
    std::vector<Validation::Result> results_;
public:
    IndexedResults(const size_t index, const std::string &toon_id, std::vector<Validation::Result> &&results)
        : index_(index), toon_id_(toon_id), results_(std::move(results)) { }
};


template<typename ValidateOne> void WorkerThread(const size_t count, const ValidateOne * const validate_one,
                                                 ThreadSafeCounter<size_t> * const next_index,
                                                 std::vector<IndexedResults> * const merged_results, std::mutex * const merge_mutex)
{
    for (;;) {
        const size_t index((*next_index)++);
        if (index >= count)
            return;

        std::string toon_id;
        std::vector<Validation::Result> results;
        if (not (*validate_one)(index, &toon_id, &results))
            continue;

        std::lock_guard<std::mutex> merge_mutex_locker(*merge_mutex);
        merged_results->emplace_back(index, toon_id, std::move(results));
    }
}


} // unnamed namespace


template<typename ValidateOne> BatchValidator::Results BatchValidator::fanOut(const size_t count, const ValidateOne &validate_one) const {
    ThreadSafeCounter<size_t> next_index(0);
    std::vector<IndexedResults> merged_results;
    std::mutex merge_mutex;

    const unsigned thread_count(static_cast<unsigned>(std::min<size_t>(worker_thread_count_, std::max<size_t>(count, 1))));
    if (thread_count == 1)
        WorkerThread(count, &validate_one, &next_index, &merged_results, &merge_mutex);
    else {
        LOG_DEBUG("validating " + std::to_string(count) + " records with " + std::to_string(thread_count) + " threads");
        std::vector<std::thread> thread_pool;
        for (unsigned i(0); i < thread_count; ++i)
            thread_pool.emplace_back(WorkerThread<ValidateOne>, count, &validate_one, &next_index, &merged_results, &merge_mutex);
        for (auto &thread : thread_pool)
            thread.join();
    }

    std::sort(merged_results.begin(), merged_results.end(),
              [](const IndexedResults &lhs, const IndexedResults &rhs) { return lhs.index_ < rhs.index_; });
    Results results;
    for (auto &indexed_results : merged_results)
        results[indexed_results.toon_id_] = std::move(indexed_results.results_);

    return results;
}


BatchValidator::Results BatchValidator::validateAll(const std::vector<std::pair<std::string, KORMARC::Record>> &records) const {
    const auto validate_one([this, &records](const size_t index, std::string * const toon_id,
                                             std::vector<Validation::Result> * const results) {
        *toon_id = records[index].first;
        *results = validateRecord(records[index].second);
        return true;
    });
    return fanOut(records.size(), validate_one);
}


BatchValidator::Results BatchValidator::validateAll(const std::vector<StoredRecord> &stored_records, const size_t limit) const {
    const size_t count((limit == 0) ? stored_records.size() : std::min(limit, stored_records.size()));
    const auto validate_one([this, &stored_records](const size_t index, std::string * const toon_id,
                                                    std::vector<Validation::Result> * const results) {
        const StoredRecord &stored_record(stored_records[index]);
        try {
            const KORMARC::Record record(KORMARC::Record::FromJson(nlohmann::json::parse(stored_record.parsed_data_)));
            *toon_id = stored_record.toon_id_;
            *results = validateRecord(record);
            return true;
        } catch (const KORMARC::Error &x) {
            LOG_DEBUG("skipping stored record " + stored_record.toon_id_ + ": " + std::string(x.what()));
        } catch (const nlohmann::json::exception &x) {
            LOG_DEBUG("skipping stored record " + stored_record.toon_id_ + ": " + std::string(x.what()));
        }
        return false;
    });
    return fanOut(count, validate_one);
}


BatchValidator::Report BatchValidator::GenerateReport(const Results &results) {
    Report report;
    report.total_records_ = static_cast<unsigned>(results.size());
    report.passed_records_ = 0;
    report.failed_records_ = 0;
    for (const unsigned tier : { 1u, 2u, 3u }) {
        report.errors_by_tier_[tier] = 0;
        report.warnings_by_tier_[tier] = 0;
    }

    for (const auto &toon_id_and_results : results) {
        bool record_passed(true);
        for (const auto &result : toon_id_and_results.second) {
            if (not result.passed_) {
                record_passed = false;
                report.errors_by_tier_[result.tier_] += static_cast<unsigned>(result.errors_.size());
            }
            report.warnings_by_tier_[result.tier_] += static_cast<unsigned>(result.warnings_.size());
        }

        if (record_passed)
            ++report.passed_records_;
        else
            ++report.failed_records_;
    }

    report.pass_rate_ = (report.total_records_ == 0)
                            ? 0.0
                            : std::round(10000.0 * report.passed_records_ / report.total_records_) / 100.0;
    return report;
}
