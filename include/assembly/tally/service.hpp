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

#ifndef ASSEMBLY_TALLY_SERVICE_HPP
#define ASSEMBLY_TALLY_SERVICE_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <boost/throw_exception.hpp>

#include <assembly/tally/codec.hpp>
#include <assembly/tally/detail/log.hpp>
#include <assembly/tally/marshalling/json.hpp>
#include <assembly/tally/receipt.hpp>
#include <assembly/tally/repository.hpp>
#include <assembly/tally/result.hpp>
#include <assembly/tally/schulze.hpp>
#include <assembly/tally/status.hpp>

namespace assembly {
    namespace tally {

        /// Outcome of a submission, the secret is set only for accepted votes.
        struct submission {
            vote_status status = vote_status::success;
            std::optional<std::string> secret;

            bool accepted() const {
                return status == vote_status::success;
            }
        };

        constexpr std::size_t storage_key_length = 32;
        constexpr std::size_t service_lock_stripes = 64;

        /*!
         * @brief Exposed operations of the tallying engine.
         *
         * Submissions of different voters run in parallel, submissions of one
         * voter to one ballot are serialized on a fixed set of lock stripes.
         * The repository refuses votes once the ballot closes, so a submission
         * racing the close either lands before it or fails. The first tally of
         * a ballot publishes its result, every later tally has to reproduce it
         * byte for byte.
         */
        template<typename StrengthStrategy = strategy::winning_votes>
        class basic_voting_service {
        public:
            basic_voting_service(ballot_repository &repository, receipt_registry &receipts,
                                 StrengthStrategy strength = StrengthStrategy()) :
                repository_(repository),
                receipts_(receipts), strength_(strength) {
            }

            submission submit_vote(const std::string &ballot, const std::string &voter, const std::string &raw) {
                ballot_config config = open_ballot(ballot);
                preference_partition vote;
                vote_status status = decode_vote(raw, config, vote);
                if (status != vote_status::success) {
                    return {status, std::nullopt};
                }
                return store(ballot, voter, to_string(vote, config.candidates));
            }

            submission submit_vote(const std::string &ballot, const std::string &voter,
                                   const classical_selection &selection) {
                ballot_config config = open_ballot(ballot);
                preference_partition vote;
                vote_status status = encode_classical(selection, config, vote);
                if (status != vote_status::success) {
                    return {status, std::nullopt};
                }
                return store(ballot, voter, to_string(vote, config.candidates));
            }

            result_record tally(const std::string &ballot) {
                std::lock_guard<std::mutex> lock(stripe(tally_locks_, ballot));

                const std::string assembly = repository_.assembly_of(ballot);
                result_record record =
                    make_result_record(repository_.assembly_title(assembly), repository_.ballot_title(ballot),
                                       repository_.get_candidate_set(ballot), repository_.get_closed_votes(ballot),
                                       strength_);

                std::optional<result_record> published = repository_.load_result(ballot);
                if (!published) {
                    repository_.store_result(ballot, record);
                    detail::logln("Result of ballot ", ballot, " published: ", record.result);
                    return record;
                }
                if (marshalling::to_json(marshalling::write_result(record)) !=
                    marshalling::to_json(marshalling::write_result(*published))) {
                    BOOST_THROW_EXCEPTION(
                        integrity_error("Recomputed result of ballot '" + ballot + "' differs from the published one."));
                }
                return *published;
            }

            /// Vote bound to a live secret, empty for unknown and purged secrets alike.
            std::optional<std::string> verify(const std::string &secret) const {
                std::optional<vote_location> location = receipts_.locate(secret);
                if (!location) {
                    return std::nullopt;
                }
                std::optional<vote_record> record = repository_.get_vote(location->ballot, location->key);
                if (!record || !matches(*record, secret)) {
                    return std::nullopt;
                }
                return record->vote;
            }

            void conclude(const std::string &assembly) {
                for (const auto &ballot : repository_.ballots_of(assembly)) {
                    if (repository_.phase(ballot) != ballot_phase::closed) {
                        BOOST_THROW_EXCEPTION(ballot_state_error("Ballot '" + ballot + "' of assembly '" + assembly +
                                                                 "' is still open."));
                    }
                }
                repository_.conclude(assembly);
                std::size_t purged = receipts_.purge(assembly);
                detail::logln("Assembly ", assembly, " concluded, ", purged, " secrets purged.");
            }

        private:
            ballot_config open_ballot(const std::string &ballot) const {
                if (repository_.phase(ballot) != ballot_phase::voting) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Ballot '" + ballot + "' is not open for voting."));
                }
                if (repository_.is_concluded(repository_.assembly_of(ballot))) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Assembly of ballot '" + ballot + "' is concluded."));
                }
                return repository_.get_candidate_set(ballot);
            }

            submission store(const std::string &ballot, const std::string &voter, const std::string &vote) {
                std::lock_guard<std::mutex> lock(stripe(voter_locks_, ballot + '\n' + voter));

                std::optional<receipt> previous = receipts_.find_receipt(ballot, voter);
                receipt r;
                r.secret = random_ascii(secret_length);
                r.location.assembly = repository_.assembly_of(ballot);
                r.location.ballot = ballot;
                r.location.key = previous ? previous->location.key : random_ascii(storage_key_length);

                repository_.put_vote(ballot, r.location.key, make_vote_record(r.secret, vote));
                receipts_.bind(voter, r);
                return {vote_status::success, r.secret};
            }

            typedef std::array<std::mutex, service_lock_stripes> lock_stripes;

            static std::mutex &stripe(lock_stripes &locks, const std::string &key) {
                return locks[std::hash<std::string>()(key) % locks.size()];
            }

            ballot_repository &repository_;
            receipt_registry &receipts_;
            StrengthStrategy strength_;

            lock_stripes voter_locks_;
            lock_stripes tally_locks_;
        };

        typedef basic_voting_service<> voting_service;

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_SERVICE_HPP
