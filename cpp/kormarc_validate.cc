/** \file   kormarc_validate.cc
 *  \brief  Validates KORMARC record files with the tiered validators.
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
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <cstdlib>
#include "BatchValidator.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "KORMARCParser.h"
#include "StringUtil.h"
#include "TOON.h"
#include "Validation.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] [--tiers=1,2,3] [--json] record_file1 [record_file2 ...]\n"
            "\tEach file must contain a single record in line format.  The exit code is 0 if all records passed.");
}


const std::string DEFAULT_CONFIG_FILE("/usr/local/etc/kormarc/kormarc_validate.conf");


struct Config {
    std::vector<unsigned> tiers_;
    unsigned worker_thread_count_;
    char subfield_delimiter_;
    bool strict_parsing_;
    Validation::InstitutionPolicy policy_;
public:
    Config(): tiers_{ 1, 2, 3 }, worker_thread_count_(1), subfield_delimiter_(KORMARC::DEFAULT_SUBFIELD_DELIMITER), strict_parsing_(false) { }
};


std::vector<unsigned> ParseTiers(const std::string &tiers_list) {
    std::vector<std::string> tier_strings;
    StringUtil::SplitThenTrimWhite(tiers_list, ',', &tier_strings);
    if (tier_strings.empty())
        LOG_ERROR("empty list of tiers!");

    std::vector<unsigned> tiers;
    for (const auto &tier_string : tier_strings) {
        unsigned tier;
        if (not StringUtil::ToUnsigned(tier_string, &tier) or tier < 1 or tier > 3)
            LOG_ERROR("bad tier \"" + tier_string + "\"! (must be 1, 2 or 3)");
        tiers.emplace_back(tier);
    }

    return tiers;
}


// Entries named "library_code_<n>" have values of the form "code:name".
Validation::InstitutionPolicy LoadInstitutionPolicy(const IniFile::Section &section) {
    const Validation::InstitutionPolicy default_policy;

    std::vector<std::pair<std::string, std::string>> known_institutions;
    for (const auto &entry_name : section.getEntryNames()) {
        if (not StringUtil::StartsWith(entry_name, "library_code_"))
            continue;

        const std::string code_and_name(section.getString(entry_name));
        const auto colon_pos(code_and_name.find(':'));
        if (colon_pos == std::string::npos)
            LOG_ERROR("missing colon in \"" + entry_name + "\"! (expected code:name)");
        known_institutions.emplace_back(StringUtil::TrimWhite(code_and_name.substr(0, colon_pos)),
                                        StringUtil::TrimWhite(code_and_name.substr(colon_pos + 1)));
    }
    if (known_institutions.empty())
        known_institutions = default_policy.known_institutions_;

    return Validation::InstitutionPolicy(section.getString("validator_name", default_policy.validator_name_),
                                         section.getString("institution_group", default_policy.institution_group_),
                                         section.getString("required_040_subfields", default_policy.required_040_subfield_codes_),
                                         known_institutions);
}


Config LoadConfig(const std::string &config_filename) {
    Config config;
    const IniFile ini_file(config_filename);

    config.tiers_ = ParseTiers(ini_file.getString("Validation", "tiers", "1,2,3"));
    config.worker_thread_count_ = ini_file.getUnsigned("Validation", "worker_threads", 1);
    if (config.worker_thread_count_ == 0)
        LOG_ERROR("\"worker_threads\" must be at least 1!");
    config.subfield_delimiter_ = ini_file.getChar("Validation", "subfield_delimiter", KORMARC::DEFAULT_SUBFIELD_DELIMITER);
    config.strict_parsing_ = ini_file.getBool("Validation", "strict_parsing", false);

    const auto policy_section(ini_file.getSection("InstitutionPolicy"));
    if (policy_section != nullptr)
        config.policy_ = LoadInstitutionPolicy(*policy_section);

    return config;
}


void PrintIssues(const std::vector<Validation::Issue> &issues) {
    for (const auto &issue : issues) {
        std::cout << "    " << Validation::SeverityToString(issue.severity_);
        if (not issue.field_tag_.empty())
            std::cout << " [" << issue.field_tag_ << ']';
        std::cout << ' ' << issue.message_ << '\n';
        if (not issue.suggestion_.empty())
            std::cout << "      -> " << issue.suggestion_ << '\n';
    }
}


void PrintResults(const BatchValidator::Results &results, const std::map<std::string, std::string> &toon_ids_to_filenames) {
    for (const auto &toon_id_and_results : results) {
        std::cout << toon_id_and_results.first << " (" << toon_ids_to_filenames.at(toon_id_and_results.first) << ")\n";
        for (const auto &result : toon_id_and_results.second) {
            std::cout << "  Tier " << result.tier_ << ' ' << result.validator_name_ << ": "
                      << (result.passed_ ? "PASSED" : "FAILED") << '\n';
            PrintIssues(result.errors_);
            PrintIssues(result.warnings_);
        }
    }
}


nlohmann::json ResultsToJson(const BatchValidator::Results &results, const std::map<std::string, std::string> &toon_ids_to_filenames,
                             const std::vector<std::string> &unparsable_filenames)
{
    nlohmann::json records(nlohmann::json::object());
    for (const auto &toon_id_and_results : results) {
        nlohmann::json results_json(nlohmann::json::array());
        for (const auto &result : toon_id_and_results.second)
            results_json.push_back(result.toJson());
        records[toon_id_and_results.first] = nlohmann::json{ { "file", toon_ids_to_filenames.at(toon_id_and_results.first) },
                                                             { "results", results_json } };
    }

    return nlohmann::json{ { "records", records }, { "unparsable_files", unparsable_filenames },
                           { "report", BatchValidator::GenerateReport(results).toJson() } };
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_filename;
    std::string tiers_override;
    bool json_output(false);
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        const std::string flag(argv[1]);
        if (StringUtil::StartsWith(flag, "--config-file="))
            config_filename = flag.substr(__builtin_strlen("--config-file="));
        else if (StringUtil::StartsWith(flag, "--tiers="))
            tiers_override = flag.substr(__builtin_strlen("--tiers="));
        else if (flag == "--json")
            json_output = true;
        else
            Usage();
        --argc, ++argv;
    }
    if (argc < 2)
        Usage();

    Config config;
    if (not config_filename.empty())
        config = LoadConfig(config_filename);
    else if (FileUtil::Exists(DEFAULT_CONFIG_FILE))
        config = LoadConfig(DEFAULT_CONFIG_FILE);
    else
        LOG_DEBUG("\"" + DEFAULT_CONFIG_FILE + "\" not found, using the built-in defaults");
    if (not tiers_override.empty())
        config.tiers_ = ParseTiers(tiers_override);

    const KORMARC::Parser parser(config.subfield_delimiter_, config.strict_parsing_);
    std::vector<std::pair<std::string, KORMARC::Record>> records;
    std::map<std::string, std::string> toon_ids_to_filenames;
    std::vector<std::string> unparsable_filenames;
    for (int arg_no(1); arg_no < argc; ++arg_no) {
        const std::string record_filename(argv[arg_no]);
        try {
            const KORMARC::Record record(parser.parseFile(record_filename));
            const std::string toon_id(TOON::Generate(TOON::DetermineRecordType(record)));
            records.emplace_back(toon_id, record);
            toon_ids_to_filenames[toon_id] = record_filename;
        } catch (const KORMARC::ParseError &parse_error) {
            LOG_WARNING("can't parse \"" + record_filename + "\": " + std::string(parse_error.what()));
            unparsable_filenames.emplace_back(record_filename);
        }
    }

    const BatchValidator batch_validator(config.tiers_, config.policy_, config.worker_thread_count_);
    const auto results(batch_validator.validateAll(records));
    const auto report(BatchValidator::GenerateReport(results));

    if (json_output)
        std::cout << ResultsToJson(results, toon_ids_to_filenames, unparsable_filenames).dump(4) << '\n';
    else {
        PrintResults(results, toon_ids_to_filenames);
        for (const auto &unparsable_filename : unparsable_filenames)
            std::cout << unparsable_filename << ": UNPARSABLE\n";
        std::cout << report.toString();
    }

    return (unparsable_filenames.empty() and report.failed_records_ == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
