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

#ifndef ASSEMBLY_TALLY_REPOSITORY_HPP
#define ASSEMBLY_TALLY_REPOSITORY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/throw_exception.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/receipt.hpp>
#include <assembly/tally/result.hpp>
#include <assembly/tally/status.hpp>
#include <assembly/tally/vote_store.hpp>

namespace assembly {
    namespace tally {

        enum class ballot_phase { pending, voting, closed };

        inline const char *to_string(ballot_phase phase) {
            switch (phase) {
                case ballot_phase::pending:
                    return "pending";
                case ballot_phase::voting:
                    return "voting";
                case ballot_phase::closed:
                    return "closed";
            }
            return "unknown";
        }

        /// Ballot as handed over by the surrounding system.
        struct ballot_definition {
            std::string id;
            std::string assembly;
            std::string title;
            ballot_config config;
            ballot_phase phase = ballot_phase::pending;
        };

        /*!
         * @brief What the tallying engine needs from the surrounding system.
         *
         * Lifecycle, persistence and identity live behind this interface.
         * Unknown ballot or assembly ids raise std::invalid_argument.
         */
        class ballot_repository {
        public:
            virtual ~ballot_repository() = default;

            virtual ballot_config get_candidate_set(const std::string &ballot) const = 0;
            virtual ballot_phase phase(const std::string &ballot) const = 0;
            virtual std::string assembly_of(const std::string &ballot) const = 0;
            virtual std::string ballot_title(const std::string &ballot) const = 0;
            virtual std::string assembly_title(const std::string &assembly) const = 0;
            virtual std::vector<std::string> ballots_of(const std::string &assembly) const = 0;

            /// Stores a vote, raises ballot_state_error unless the ballot is open and its assembly not concluded.
            virtual void put_vote(const std::string &ballot, const std::string &key, const vote_record &record) = 0;
            virtual std::optional<vote_record> get_vote(const std::string &ballot, const std::string &key) const = 0;

            /// Accepted votes of a ballot, only available once voting is closed.
            virtual std::vector<vote_record> get_closed_votes(const std::string &ballot) const = 0;

            virtual void store_result(const std::string &ballot, const result_record &result) = 0;
            virtual std::optional<result_record> load_result(const std::string &ballot) const = 0;

            virtual bool is_concluded(const std::string &assembly) const = 0;
            virtual void conclude(const std::string &assembly) = 0;
        };

        /// Repository kept entirely in memory.
        class memory_repository : public ballot_repository {
        public:
            void add_assembly(const std::string &id, const std::string &title) {
                std::lock_guard<std::shared_mutex> lock(mutex_);
                assemblies_[id] = title;
            }

            void add_ballot(const ballot_definition &ballot) {
                std::lock_guard<std::shared_mutex> lock(mutex_);
                if (assemblies_.find(ballot.assembly) == assemblies_.end()) {
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Unknown assembly '" + ballot.assembly + "'."));
                }
                if (concluded_.count(ballot.assembly)) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Assembly '" + ballot.assembly + "' is concluded."));
                }
                if (!ballots_.emplace(ballot.id, ballot).second) {
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Duplicate ballot '" + ballot.id + "'."));
                }
            }

            /// Driven by the lifecycle timers of the surrounding system.
            void set_phase(const std::string &ballot, ballot_phase phase) {
                std::lock_guard<std::shared_mutex> lock(mutex_);
                find_ballot(ballot).phase = phase;
            }

            ballot_config get_candidate_set(const std::string &ballot) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return find_ballot(ballot).config;
            }

            ballot_phase phase(const std::string &ballot) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return find_ballot(ballot).phase;
            }

            std::string assembly_of(const std::string &ballot) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return find_ballot(ballot).assembly;
            }

            std::string ballot_title(const std::string &ballot) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return find_ballot(ballot).title;
            }

            std::string assembly_title(const std::string &assembly) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                auto it = assemblies_.find(assembly);
                if (it == assemblies_.end()) {
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Unknown assembly '" + assembly + "'."));
                }
                return it->second;
            }

            std::vector<std::string> ballots_of(const std::string &assembly) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                std::vector<std::string> ids;
                for (const auto &entry : ballots_) {
                    if (entry.second.assembly == assembly) {
                        ids.push_back(entry.first);
                    }
                }
                return ids;
            }

            // set_phase and conclude lock exclusively, no vote lands after either of them.
            void put_vote(const std::string &ballot, const std::string &key, const vote_record &record) override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                const ballot_definition &definition = find_ballot(ballot);
                if (definition.phase != ballot_phase::voting) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Ballot '" + ballot + "' is not open for voting."));
                }
                if (concluded_.count(definition.assembly)) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Assembly of ballot '" + ballot + "' is concluded."));
                }
                votes_.put(ballot, key, record);
            }

            /// Reloads a persisted vote whatever the ballot phase.
            void restore_vote(const std::string &ballot, const std::string &key, const vote_record &record) {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                find_ballot(ballot);
                votes_.put(ballot, key, record);
            }

            std::optional<vote_record> get_vote(const std::string &ballot, const std::string &key) const override {
                return votes_.get(ballot, key);
            }

            std::vector<ledger_entry> ledger() const {
                return votes_.entries();
            }

            std::vector<vote_record> get_closed_votes(const std::string &ballot) const override {
                if (phase(ballot) != ballot_phase::closed) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Voting on ballot '" + ballot + "' is not closed."));
                }
                return votes_.ballot_votes(ballot);
            }

            void store_result(const std::string &ballot, const result_record &result) override {
                std::lock_guard<std::shared_mutex> lock(mutex_);
                if (!results_.emplace(ballot, result).second) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Result of ballot '" + ballot + "' already published."));
                }
            }

            std::optional<result_record> load_result(const std::string &ballot) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                auto it = results_.find(ballot);
                if (it == results_.end()) {
                    return std::nullopt;
                }
                return it->second;
            }

            bool is_concluded(const std::string &assembly) const override {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return concluded_.count(assembly) > 0;
            }

            void conclude(const std::string &assembly) override {
                std::lock_guard<std::shared_mutex> lock(mutex_);
                concluded_.insert(assembly);
            }

        private:
            ballot_definition &find_ballot(const std::string &ballot) {
                auto it = ballots_.find(ballot);
                if (it == ballots_.end()) {
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Unknown ballot '" + ballot + "'."));
                }
                return it->second;
            }

            const ballot_definition &find_ballot(const std::string &ballot) const {
                auto it = ballots_.find(ballot);
                if (it == ballots_.end()) {
                    BOOST_THROW_EXCEPTION(std::invalid_argument("Unknown ballot '" + ballot + "'."));
                }
                return it->second;
            }

            mutable std::shared_mutex mutex_;
            std::map<std::string, std::string> assemblies_;
            std::map<std::string, ballot_definition> ballots_;
            std::map<std::string, result_record> results_;
            std::set<std::string> concluded_;
            vote_store votes_;
        };

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_REPOSITORY_HPP
