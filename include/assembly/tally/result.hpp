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

#ifndef ASSEMBLY_TALLY_RESULT_HPP
#define ASSEMBLY_TALLY_RESULT_HPP

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <boost/throw_exception.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/codec.hpp>
#include <assembly/tally/pairwise.hpp>
#include <assembly/tally/preference.hpp>
#include <assembly/tally/receipt.hpp>
#include <assembly/tally/schulze.hpp>
#include <assembly/tally/status.hpp>

namespace assembly {
    namespace tally {

        /// Statistics of one boundary between adjacent result levels.
        struct result_level {
            std::vector<std::string> preferred;
            std::vector<std::string> rejected;
            std::size_t support = 0;
            std::size_t opposition = 0;
        };

        inline bool operator==(const result_level &a, const result_level &b) {
            return a.preferred == b.preferred && a.rejected == b.rejected && a.support == b.support &&
                   a.opposition == b.opposition;
        }

        /*!
         * @brief Pro/Contra for every adjacent pair of levels.
         *
         * Members of a level are tied in the aggregate, so the first member of
         * each level stands in for the whole level.
         */
        inline std::vector<result_level> detailed_result(const preference_partition &result,
                                                         const pairwise_matrix &d,
                                                         const candidate_set &candidates) {
            std::vector<result_level> detailed;
            const auto &levels = result.levels();
            for (std::size_t i = 0; i + 1 < levels.size(); ++i) {
                result_level level;
                for (std::size_t idx : levels[i]) {
                    level.preferred.push_back(candidates.shortname(idx));
                }
                for (std::size_t idx : levels[i + 1]) {
                    level.rejected.push_back(candidates.shortname(idx));
                }
                const std::size_t x = levels[i].front();
                const std::size_t y = levels[i + 1].front();
                level.support = d(x, y);
                level.opposition = d(y, x);
                detailed.push_back(std::move(level));
            }
            return detailed;
        }

        /// Number of votes putting each position in a non-trivial first level.
        inline std::map<std::string, std::size_t> classical_counts(const std::vector<preference_partition> &votes,
                                                                   const candidate_set &candidates) {
            std::map<std::string, std::size_t> counts;
            for (std::size_t i = 0; i < candidates.size(); ++i) {
                counts[candidates.shortname(i)] = 0;
            }
            for (const auto &vote : votes) {
                if (vote.size() > 1) {
                    for (std::size_t idx : vote.levels().front()) {
                        ++counts[candidates.shortname(idx)];
                    }
                }
            }
            return counts;
        }

        inline std::size_t abstentions(const std::vector<preference_partition> &votes) {
            return std::count_if(votes.begin(), votes.end(),
                                 [](const preference_partition &vote) { return vote.is_abstention(); });
        }

        /// Public, immutable outcome of a ballot.
        struct result_record {
            std::string assembly;
            std::string ballot;
            std::vector<candidate> candidates;
            bool use_bar = false;
            vote_mode mode = vote_mode::preferential;
            std::size_t votes = 0;
            std::string result;
            std::vector<result_level> levels;
            std::map<std::string, std::size_t> counts;
            std::size_t abstentions = 0;
            std::vector<vote_record> vote_records;

            ballot_config config() const {
                return ballot_config {candidate_set(candidates, use_bar), mode, votes};
            }
        };

        /// Decodes a stored ledger, a record that fails to decode means the ledger was tampered with.
        inline std::vector<preference_partition> decode_ledger(const std::vector<vote_record> &records,
                                                               const ballot_config &config) {
            std::vector<preference_partition> votes;
            votes.reserve(records.size());
            for (const auto &record : records) {
                preference_partition vote;
                vote_status status = decode_vote(record.vote, config, vote);
                if (status != vote_status::success) {
                    BOOST_THROW_EXCEPTION(integrity_error("Stored vote '" + record.vote +
                                                          "' is malformed: " + status_message(status)));
                }
                votes.push_back(std::move(vote));
            }
            return votes;
        }

        template<typename StrengthStrategy = strategy::winning_votes>
        result_record make_result_record(const std::string &assembly_title, const std::string &ballot_title,
                                         const ballot_config &config, std::vector<vote_record> records,
                                         StrengthStrategy strength = StrengthStrategy()) {
            const candidate_set &candidates = config.candidates;
            std::vector<preference_partition> votes = decode_ledger(records, config);

            pairwise_matrix d = pairwise_preference(votes, candidates.size());
            preference_partition aggregate = schulze_evaluate(d, strength);

            result_record record;
            record.assembly = assembly_title;
            record.ballot = ballot_title;
            record.candidates = candidates.candidates();
            record.use_bar = candidates.use_bar();
            record.mode = config.mode;
            record.votes = config.votes;
            record.result = to_string(aggregate, candidates);
            record.levels = detailed_result(aggregate, d, candidates);
            if (config.mode == vote_mode::classical) {
                record.counts = classical_counts(votes, candidates);
            }
            record.abstentions = abstentions(votes);
            std::sort(records.begin(), records.end());
            record.vote_records = std::move(records);
            return record;
        }

        /// Recomputes a published record from its own ledger and compares the outcome.
        template<typename StrengthStrategy = strategy::winning_votes>
        bool verify_result(const result_record &published, StrengthStrategy strength = StrengthStrategy()) {
            result_record recomputed = make_result_record(published.assembly, published.ballot, published.config(),
                                                          published.vote_records, strength);
            return recomputed.result == published.result && recomputed.levels == published.levels &&
                   recomputed.counts == published.counts && recomputed.abstentions == published.abstentions;
        }

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_RESULT_HPP
