//---------------------------------------------------------------------------//
// Copyright (c) 2018-2022 Mikhail Komarov <nemo@nil.foundation>
// Copyright (c) 2022 Ilias Khairullin <ilias@nil.foundation>
// Copyright (c) 2022 Noam Y <@NoamDev>
// Copyright (c) 2022 The assembly_tally Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//---------------------------------------------------------------------------//

#define BOOST_ENABLE_ASSERT_HANDLER
#include <boost/assert.hpp>

#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/codec.hpp>
#include <assembly/tally/detail/log.hpp>
#include <assembly/tally/marshalling/json.hpp>
#include <assembly/tally/receipt.hpp>
#include <assembly/tally/repository.hpp>
#include <assembly/tally/result.hpp>
#include <assembly/tally/schulze.hpp>
#include <assembly/tally/service.hpp>

using namespace assembly::tally;
using assembly::tally::detail::logln;

struct marshalling_policy {
    using ptree = marshalling::ptree;

    /// Published artifacts are written once, an existing file is never replaced.
    template<typename Path>
    static bool write_obj(const Path &path, const std::string &blob) {
        if (std::filesystem::exists(path)) {
            std::cout << "File " << path << " exists and won't be overwritten." << std::endl;
            return false;
        }
        std::ofstream out(path, std::ios_base::binary);
        out << blob;
        out.close();
        return true;
    }

    template<typename Path>
    static std::string read_obj(const Path &path) {
        BOOST_ASSERT_MSG(
                std::filesystem::exists(path),
                (std::string("File ") + path + std::string(" doesn't exist, make sure you created it!")).c_str());
        std::ifstream in(path, std::ios_base::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    /// State files (ledger, receipts, ballot definitions) are rewritten on every phase.
    template<typename Path>
    static void write_state(const Path &path, const ptree &tree) {
        std::ofstream out(path, std::ios_base::binary);
        out << marshalling::to_json(tree);
        out.close();
    }

    template<typename Path>
    static ptree read_json(const Path &path) {
        return marshalling::parse_json(read_obj(path));
    }

    template<typename Path>
    static ptree read_json_or_empty(const Path &path) {
        if (!std::filesystem::exists(path)) {
            return ptree();
        }
        return read_json(path);
    }

    template<typename Path>
    static result_record read_result(const Path &path) {
        return marshalling::read_result(read_json(path));
    }

    template<typename Path>
    static bool write_result(const Path &path, const result_record &record) {
        return write_obj(path, marshalling::to_json(marshalling::write_result(record)));
    }
};

/*!
 * @brief Everything a phase works on: the assembly with its ballots, the
 * vote ledger and the receipt registry.
 */
struct session_state {
    marshalling::assembly_definition definition;
    memory_repository repository;
    receipt_registry receipts;

    explicit session_state(const marshalling::assembly_definition &loaded) :
        definition(loaded) {
        marshalling::load_assembly(definition, repository);
        if (definition.concluded) {
            receipts.purge(definition.id);
        }
    }

    void load_ledger(const std::vector<ledger_entry> &ledger) {
        for (const auto &entry : ledger) {
            repository.restore_vote(entry.ballot, entry.key, entry.record);
        }
    }

    void load_receipts(const std::vector<std::pair<std::string, receipt>> &entries) {
        for (const auto &entry : entries) {
            receipts.bind(entry.first, entry.second);
        }
    }
};

inline submission process_vote_phase(session_state &state, const std::string &ballot, const std::string &voter,
                                     const std::string &raw_vote) {
    logln("Vote phase started...");
    voting_service service(state.repository, state.receipts);
    submission s = service.submit_vote(ballot, voter, raw_vote);
    logln(s.status);
    return s;
}

inline submission process_vote_phase(session_state &state, const std::string &ballot, const std::string &voter,
                                     const classical_selection &selection) {
    logln("Vote phase started...");
    voting_service service(state.repository, state.receipts);
    submission s = service.submit_vote(ballot, voter, selection);
    logln(s.status);
    return s;
}

template<typename StrengthStrategy>
result_record process_tally_phase(session_state &state, const std::string &ballot,
                                  const std::optional<result_record> &published) {
    logln("Tally phase started...");
    if (published) {
        state.repository.store_result(ballot, *published);
        logln("Published result found, recomputing for comparison...");
    }
    basic_voting_service<StrengthStrategy> service(state.repository, state.receipts);
    result_record record = service.tally(ballot);
    logln("Tally phase finished.");
    return record;
}

inline result_record process_tally_phase(session_state &state, const std::string &ballot,
                                         const std::string &strength,
                                         const std::optional<result_record> &published) {
    if (strength == "margin") {
        return process_tally_phase<strategy::margin>(state, ballot, published);
    }
    if (strength == "support") {
        return process_tally_phase<strategy::support>(state, ballot, published);
    }
    BOOST_ASSERT_MSG(strength == "winning_votes", "Unknown strategy, allowed values: winning_votes, margin, support");
    return process_tally_phase<strategy::winning_votes>(state, ballot, published);
}

inline std::optional<std::string> process_verify_vote_phase(const result_record &published,
                                                            const std::string &secret) {
    logln("Looking up the vote of the secret among ", published.vote_records.size(), " votes...");
    return find_vote(published.vote_records, secret);
}

inline bool process_verify_result_phase(const result_record &published, const std::string &strength) {
    logln("Recomputing the result of ballot ", published.ballot, "...");
    if (strength == "margin") {
        return verify_result(published, strategy::margin());
    }
    if (strength == "support") {
        return verify_result(published, strategy::support());
    }
    BOOST_ASSERT_MSG(strength == "winning_votes", "Unknown strategy, allowed values: winning_votes, margin, support");
    return verify_result(published, strategy::winning_votes());
}

inline void process_conclude_phase(session_state &state) {
    logln("Conclude phase started...");
    voting_service service(state.repository, state.receipts);
    service.conclude(state.definition.id);
    state.definition.concluded = true;
    logln("Conclude phase finished.");
}
