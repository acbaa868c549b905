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

#include "common.hpp"

namespace boost {
    void assertion_failed(char const *expr, char const *function, char const *file, long line) {
        std::cerr << "Error: in file " << file << ": in function " << function << ": on line " << line << std::endl;
        std::exit(1);
    }
    void assertion_failed_msg(char const *expr, char const *msg, char const *function, char const *file, long line) {
        std::cerr << "Error: in file " << file << ": in function " << function << ": on line " << line << std::endl
                  << std::endl;
        std::cerr << "Error message:" << std::endl << msg << std::endl;
        std::exit(1);
    }
}    // namespace boost

marshalling::assembly_definition read_definition(const boost::program_options::variables_map &vm) {
    return marshalling::read_assembly(marshalling_policy::read_json(vm["assembly"].as<std::string>()));
}

void load_state(const boost::program_options::variables_map &vm, session_state &state) {
    state.load_ledger(
        marshalling::read_ledger(marshalling_policy::read_json_or_empty(vm["ledger"].as<std::string>())));
    state.load_receipts(
        marshalling::read_receipts(marshalling_policy::read_json_or_empty(vm["receipts"].as<std::string>())));
}

void save_state(const boost::program_options::variables_map &vm, const session_state &state) {
    logln("Marshalling started...");
    marshalling_policy::write_state(vm["ledger"].as<std::string>(),
                                    marshalling::write_ledger(state.repository.ledger()));
    marshalling_policy::write_state(vm["receipts"].as<std::string>(),
                                    marshalling::write_receipts(state.receipts.snapshot()));
    marshalling_policy::write_state(vm["assembly"].as<std::string>(), marshalling::write_assembly(state.definition));
    logln("Marshalling finished.");
}

int process_vote(const boost::program_options::variables_map &vm) {
    BOOST_ASSERT_MSG(vm.count("ballot"), "Ballot is not specified!");
    BOOST_ASSERT_MSG(vm.count("voter"), "Voter is not specified!");
    session_state state(read_definition(vm));
    load_state(vm, state);
    const std::string ballot = vm["ballot"].as<std::string>();
    const std::string voter = vm["voter"].as<std::string>();

    submission s;
    if (vm.count("select") || vm.count("reject-all")) {
        classical_selection selection;
        if (vm.count("select")) {
            selection.selected = vm["select"].as<std::vector<std::string>>();
        }
        selection.reject_all = vm.count("reject-all") > 0;
        s = process_vote_phase(state, ballot, voter, selection);
    } else {
        s = process_vote_phase(state, ballot, voter, vm.count("vote") ? vm["vote"].as<std::string>() : "");
    }
    if (!s.accepted()) {
        std::cerr << "Vote rejected: " << s.status << std::endl;
        return 1;
    }
    save_state(vm, state);
    std::cout << "Secret: " << *s.secret << std::endl;
    return 0;
}

int process_tally(const boost::program_options::variables_map &vm) {
    BOOST_ASSERT_MSG(vm.count("ballot"), "Ballot is not specified!");
    session_state state(read_definition(vm));
    load_state(vm, state);
    const std::string result_path = vm["result-output"].as<std::string>();

    std::optional<result_record> published;
    if (std::filesystem::exists(result_path)) {
        published = marshalling_policy::read_result(result_path);
    }
    result_record record = process_tally_phase(state, vm["ballot"].as<std::string>(),
                                               vm["strategy"].as<std::string>(), published);
    if (!published) {
        marshalling_policy::write_result(result_path, record);
    }
    std::cout << "Result: " << record.result << std::endl;
    for (const auto &level : record.levels) {
        std::cout << "  " << level.preferred.front() << " > " << level.rejected.front() << ": " << level.support
                  << " pro, " << level.opposition << " contra" << std::endl;
    }
    std::cout << "Abstentions: " << record.abstentions << std::endl;
    return 0;
}

int process_verify_vote(const boost::program_options::variables_map &vm) {
    BOOST_ASSERT_MSG(vm.count("secret"), "Secret is not specified!");
    result_record published = marshalling_policy::read_result(vm["result-output"].as<std::string>());
    std::optional<std::string> vote = process_verify_vote_phase(published, vm["secret"].as<std::string>());
    if (!vote) {
        std::cout << "No vote found for this secret in " << published.ballot << "." << std::endl;
        return 1;
    }
    std::cout << published.ballot << ": " << *vote << std::endl;
    return 0;
}

int process_verify_result(const boost::program_options::variables_map &vm) {
    result_record published = marshalling_policy::read_result(vm["result-output"].as<std::string>());
    if (!process_verify_result_phase(published, vm["strategy"].as<std::string>())) {
        std::cout << "Result of " << published.ballot << " does NOT match its votes." << std::endl;
        return 1;
    }
    std::cout << "Result of " << published.ballot << " matches its " << published.vote_records.size()
              << " votes: " << published.result << std::endl;
    return 0;
}

int process_conclude(const boost::program_options::variables_map &vm) {
    session_state state(read_definition(vm));
    load_state(vm, state);
    process_conclude_phase(state);
    save_state(vm, state);
    return 0;
}

int main(int argc, char *argv[]) {
    boost::program_options::options_description desc("Assembly ballot tallying CLI (Schulze method).");
    // clang-format off
    desc.add_options()
            ("help,h", "Display help message.")
            ("phase,p", boost::program_options::value<std::string>(),"Execute phase, allowed values:\n\t - vote (decode and store a vote, print the voter's secret),\n\t - tally (count a closed ballot and publish its result file once),\n\t - verify_vote (find the vote of a secret in a published result file),\n\t - verify_result (recompute a published result file from its votes),\n\t - conclude (conclude the assembly and purge all its secrets).")
            ("assembly,a", boost::program_options::value<std::string>()->default_value("assembly.json"), "Assembly and ballot definitions path.")
            ("ledger,l", boost::program_options::value<std::string>()->default_value("ledger.json"), "Vote ledger path.")
            ("receipts,r", boost::program_options::value<std::string>()->default_value("receipts.json"), "Receipt registry path.")
            ("result-output,o", boost::program_options::value<std::string>()->default_value("result.json"), "Result file path.")
            ("ballot,b", boost::program_options::value<std::string>(), "Ballot id.")
            ("voter", boost::program_options::value<std::string>(), "Voter id.")
            ("vote", boost::program_options::value<std::string>(), "Preferential vote, e.g. \"A=B>_bar_>C\".")
            ("select", boost::program_options::value<std::vector<std::string>>()->multitoken(), "Selected candidates of a classical vote.")
            ("reject-all", "Reject all candidates of a classical vote.")
            ("secret,s", boost::program_options::value<std::string>(), "Voter's secret.")
            ("strategy", boost::program_options::value<std::string>()->default_value("winning_votes"), "Link strength, allowed values: winning_votes, margin, support.");
    // clang-format on

    boost::program_options::variables_map vm;
    boost::program_options::store(boost::program_options::command_line_parser(argc, argv).options(desc).run(), vm);
    boost::program_options::notify(vm);

    if (vm.count("help") || !vm.count("phase")) {
        std::cout << desc << std::endl;
        return 0;
    }

    try {
        const std::string phase = vm["phase"].as<std::string>();
        if (phase == "vote") {
            return process_vote(vm);
        } else if (phase == "tally") {
            return process_tally(vm);
        } else if (phase == "verify_vote") {
            return process_verify_vote(vm);
        } else if (phase == "verify_result") {
            return process_verify_result(vm);
        } else if (phase == "conclude") {
            return process_conclude(vm);
        } else {
            std::cout << desc << std::endl;
            return 0;
        }
    } catch (const boost::property_tree::ptree_error &e) {
        std::cerr << "Malformed input: " << e.what() << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
