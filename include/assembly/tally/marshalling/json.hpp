//---------------------------------------------------------------------------//
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

#ifndef ASSEMBLY_TALLY_MARSHALLING_JSON_HPP
#define ASSEMBLY_TALLY_MARSHALLING_JSON_HPP

#include <cstddef>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/throw_exception.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/receipt.hpp>
#include <assembly/tally/repository.hpp>
#include <assembly/tally/result.hpp>
#include <assembly/tally/vote_store.hpp>

namespace assembly {
    namespace tally {
        namespace marshalling {

            using boost::property_tree::ptree;

            /// Assembly with its ballots, the content of a ballot definition file.
            struct assembly_definition {
                std::string id;
                std::string title;
                bool concluded = false;
                std::vector<ballot_definition> ballots;
            };

            namespace detail {

                // Children are appended by key, shortnames and ids may contain the path separator.
                inline void append(ptree &tree, const std::string &key, const ptree &child) {
                    tree.push_back(std::make_pair(key, child));
                }

                inline ptree value(const std::string &data) {
                    return ptree(data);
                }

                inline ptree string_array(const std::vector<std::string> &items) {
                    ptree array;
                    for (const auto &item : items) {
                        append(array, "", value(item));
                    }
                    return array;
                }

                inline std::vector<std::string> read_string_array(const ptree &array) {
                    std::vector<std::string> items;
                    for (const auto &child : array) {
                        items.push_back(child.second.data());
                    }
                    return items;
                }

                inline const ptree &child(const ptree &tree, const std::string &key) {
                    auto it = tree.find(key);
                    if (it == tree.not_found()) {
                        BOOST_THROW_EXCEPTION(std::invalid_argument("Missing JSON field '" + key + "'."));
                    }
                    return it->second;
                }

                inline const ptree &optional_child(const ptree &tree, const std::string &key) {
                    static const ptree empty;
                    auto it = tree.find(key);
                    return it == tree.not_found() ? empty : it->second;
                }

                inline vote_mode read_mode(const std::string &mode) {
                    if (mode == "classical") {
                        return vote_mode::classical;
                    }
                    if (mode == "preferential") {
                        return vote_mode::preferential;
                    }
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Unknown vote mode '" + mode + "'."));
                }

                inline ballot_phase read_phase(const std::string &phase) {
                    if (phase == "pending") {
                        return ballot_phase::pending;
                    }
                    if (phase == "voting") {
                        return ballot_phase::voting;
                    }
                    if (phase == "closed") {
                        return ballot_phase::closed;
                    }
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Unknown ballot phase '" + phase + "'."));
                }

                inline ptree write_candidates(const std::vector<candidate> &candidates) {
                    ptree tree;
                    for (const auto &c : candidates) {
                        append(tree, c.shortname, value(c.title));
                    }
                    return tree;
                }

                inline std::vector<candidate> read_candidates(const ptree &tree) {
                    std::vector<candidate> candidates;
                    for (const auto &entry : tree) {
                        candidates.push_back({entry.first, entry.second.data()});
                    }
                    return candidates;
                }

                inline ptree write_vote_record(const vote_record &record) {
                    ptree tree;
                    tree.put("vote", record.vote);
                    tree.put("salt", record.salt);
                    tree.put("hash", record.hash);
                    return tree;
                }

                inline vote_record read_vote_record(const ptree &tree) {
                    return {tree.get<std::string>("vote"), tree.get<std::string>("salt"),
                            tree.get<std::string>("hash")};
                }

            }    // namespace detail

            inline std::string to_json(const ptree &tree) {
                std::ostringstream out;
                boost::property_tree::write_json(out, tree);
                return out.str();
            }

            inline ptree parse_json(std::istream &in) {
                ptree tree;
                boost::property_tree::read_json(in, tree);
                return tree;
            }

            inline ptree parse_json(const std::string &text) {
                std::istringstream in(text);
                return parse_json(in);
            }

            inline ptree write_ballot(const ballot_definition &ballot) {
                ptree tree;
                tree.put("id", ballot.id);
                tree.put("title", ballot.title);
                tree.put("phase", to_string(ballot.phase));
                tree.put("mode", to_string(ballot.config.mode));
                tree.put("use_bar", ballot.config.candidates.use_bar());
                tree.put("selectable", ballot.config.votes);
                detail::append(tree, "candidates", detail::write_candidates(ballot.config.candidates.candidates()));
                return tree;
            }

            inline ballot_definition read_ballot(const ptree &tree, const std::string &assembly) {
                ballot_definition ballot;
                ballot.id = tree.get<std::string>("id");
                ballot.assembly = assembly;
                ballot.title = tree.get<std::string>("title", ballot.id);
                ballot.phase = detail::read_phase(tree.get<std::string>("phase", "pending"));
                ballot.config.mode = detail::read_mode(tree.get<std::string>("mode", "preferential"));
                ballot.config.votes = tree.get<std::size_t>("selectable", 0);
                ballot.config.candidates = candidate_set(detail::read_candidates(detail::child(tree, "candidates")),
                                                         tree.get<bool>("use_bar", false));
                return ballot;
            }

            inline ptree write_assembly(const assembly_definition &definition) {
                ptree tree;
                tree.put("id", definition.id);
                tree.put("title", definition.title);
                tree.put("concluded", definition.concluded);
                ptree ballots;
                for (const auto &ballot : definition.ballots) {
                    detail::append(ballots, "", write_ballot(ballot));
                }
                detail::append(tree, "ballots", ballots);
                return tree;
            }

            inline assembly_definition read_assembly(const ptree &tree) {
                assembly_definition definition;
                definition.id = tree.get<std::string>("id");
                definition.title = tree.get<std::string>("title", definition.id);
                definition.concluded = tree.get<bool>("concluded", false);
                for (const auto &entry : detail::optional_child(tree, "ballots")) {
                    definition.ballots.push_back(read_ballot(entry.second, definition.id));
                }
                return definition;
            }

            /// Fills a repository with an assembly, concluded assemblies are marked as such.
            inline void load_assembly(const assembly_definition &definition, memory_repository &repository) {
                repository.add_assembly(definition.id, definition.title);
                for (const auto &ballot : definition.ballots) {
                    repository.add_ballot(ballot);
                }
                if (definition.concluded) {
                    repository.conclude(definition.id);
                }
            }

            inline ptree write_ledger(const std::vector<ledger_entry> &ledger) {
                ptree tree;
                for (const auto &entry : ledger) {
                    ptree child = detail::write_vote_record(entry.record);
                    child.put("ballot", entry.ballot);
                    child.put("key", entry.key);
                    detail::append(tree, "", child);
                }
                return tree;
            }

            inline std::vector<ledger_entry> read_ledger(const ptree &tree) {
                std::vector<ledger_entry> ledger;
                for (const auto &entry : tree) {
                    ledger.push_back({entry.second.get<std::string>("ballot"), entry.second.get<std::string>("key"),
                                      detail::read_vote_record(entry.second)});
                }
                return ledger;
            }

            inline ptree write_receipts(const std::vector<std::pair<std::string, receipt>> &receipts) {
                ptree tree;
                for (const auto &entry : receipts) {
                    ptree child;
                    child.put("voter", entry.first);
                    child.put("secret", entry.second.secret);
                    child.put("assembly", entry.second.location.assembly);
                    child.put("ballot", entry.second.location.ballot);
                    child.put("key", entry.second.location.key);
                    detail::append(tree, "", child);
                }
                return tree;
            }

            inline std::vector<std::pair<std::string, receipt>> read_receipts(const ptree &tree) {
                std::vector<std::pair<std::string, receipt>> receipts;
                for (const auto &entry : tree) {
                    const ptree &child = entry.second;
                    receipt r {child.get<std::string>("secret"),
                               {child.get<std::string>("assembly"), child.get<std::string>("ballot"),
                                child.get<std::string>("key")}};
                    receipts.emplace_back(child.get<std::string>("voter"), r);
                }
                return receipts;
            }

            inline ptree write_result(const result_record &record) {
                ptree tree;
                tree.put("assembly", record.assembly);
                tree.put("ballot", record.ballot);
                tree.put("result", record.result);
                detail::append(tree, "candidates", detail::write_candidates(record.candidates));
                tree.put("use_bar", record.use_bar);
                tree.put("mode", to_string(record.mode));
                tree.put("selectable", record.votes);

                ptree levels;
                for (const auto &level : record.levels) {
                    ptree child;
                    detail::append(child, "preferred", detail::string_array(level.preferred));
                    detail::append(child, "rejected", detail::string_array(level.rejected));
                    child.put("support", level.support);
                    child.put("opposition", level.opposition);
                    detail::append(levels, "", child);
                }
                detail::append(tree, "levels", levels);

                if (record.mode == vote_mode::classical) {
                    ptree counts;
                    for (const auto &count : record.counts) {
                        detail::append(counts, count.first, detail::value(std::to_string(count.second)));
                    }
                    detail::append(tree, "counts", counts);
                }
                tree.put("abstentions", record.abstentions);

                ptree votes;
                for (const auto &vote : record.vote_records) {
                    detail::append(votes, "", detail::write_vote_record(vote));
                }
                detail::append(tree, "votes", votes);
                return tree;
            }

            inline result_record read_result(const ptree &tree) {
                result_record record;
                record.assembly = tree.get<std::string>("assembly");
                record.ballot = tree.get<std::string>("ballot");
                record.result = tree.get<std::string>("result");
                record.candidates = detail::read_candidates(detail::child(tree, "candidates"));
                record.use_bar = tree.get<bool>("use_bar");
                record.mode = detail::read_mode(tree.get<std::string>("mode"));
                record.votes = tree.get<std::size_t>("selectable", 0);

                for (const auto &entry : detail::optional_child(tree, "levels")) {
                    result_level level;
                    level.preferred = detail::read_string_array(detail::child(entry.second, "preferred"));
                    level.rejected = detail::read_string_array(detail::child(entry.second, "rejected"));
                    level.support = entry.second.get<std::size_t>("support");
                    level.opposition = entry.second.get<std::size_t>("opposition");
                    record.levels.push_back(std::move(level));
                }
                for (const auto &entry : detail::optional_child(tree, "counts")) {
                    record.counts[entry.first] = entry.second.get_value<std::size_t>();
                }
                record.abstentions = tree.get<std::size_t>("abstentions", 0);
                for (const auto &entry : detail::optional_child(tree, "votes")) {
                    record.vote_records.push_back(detail::read_vote_record(entry.second));
                }
                return record;
            }

        }    // namespace marshalling
    }        // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_MARSHALLING_JSON_HPP
