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

#ifndef ASSEMBLY_TALLY_RECEIPT_HPP
#define ASSEMBLY_TALLY_RECEIPT_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <nil/crypto3/hash/algorithm/hash.hpp>
#include <nil/crypto3/hash/sha2.hpp>

#include <boost/throw_exception.hpp>

#include <assembly/tally/status.hpp>

namespace assembly {
    namespace tally {

        /// Published form of one vote.
        struct vote_record {
            std::string vote;
            std::string salt;
            std::string hash;
        };

        inline bool operator==(const vote_record &a, const vote_record &b) {
            return a.vote == b.vote && a.salt == b.salt && a.hash == b.hash;
        }

        inline bool operator<(const vote_record &a, const vote_record &b) {
            return std::tie(a.vote, a.salt, a.hash) < std::tie(b.vote, b.salt, b.hash);
        }

        constexpr std::size_t secret_length = 12;
        constexpr std::size_t salt_length = 12;

        /// Random string over [A-Za-z0-9].
        inline std::string random_ascii(std::size_t length) {
            static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
            std::random_device rd;
            std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);
            std::string out(length, '\0');
            for (auto &c : out) {
                c = alphabet[dist(rd)];
            }
            return out;
        }

        /// Hex encoded SHA-512 over salt, secret and vote string concatenated.
        inline std::string encrypt_vote(const std::string &salt, const std::string &secret, const std::string &vote) {
            using namespace nil::crypto3;
            const std::string input = salt + secret + vote;
            typename hashes::sha2<512>::digest_type digest = hash<hashes::sha2<512>>(input.begin(), input.end());
            return std::to_string(digest);
        }

        inline vote_record make_vote_record(const std::string &secret, const std::string &vote) {
            vote_record record;
            record.vote = vote;
            record.salt = random_ascii(salt_length);
            record.hash = encrypt_vote(record.salt, secret, vote);
            return record;
        }

        inline bool matches(const vote_record &record, const std::string &secret) {
            return encrypt_vote(record.salt, secret, record.vote) == record.hash;
        }

        /*!
         * @brief Looks a secret up in a published ledger.
         *
         * Scans every record, the ledger holds no index from secrets to
         * votes.
         */
        inline std::optional<std::string> find_vote(const std::vector<vote_record> &ledger,
                                                    const std::string &secret) {
            for (const auto &record : ledger) {
                if (matches(record, secret)) {
                    return record.vote;
                }
            }
            return std::nullopt;
        }

        /// Where the vote of a receipt is stored.
        struct vote_location {
            std::string assembly;
            std::string ballot;
            std::string key;
        };

        struct receipt {
            std::string secret;
            vote_location location;
        };

        /*!
         * @brief Per-voter secrets, kept apart from the vote records.
         *
         * Voter entries allow resubmission under the same storage key, secret
         * entries allow verification. Both are dropped for a whole assembly
         * on conclusion.
         */
        class receipt_registry {
        public:
            typedef std::map<std::string, receipt> voter_map;

            std::optional<receipt> find_receipt(const std::string &ballot, const std::string &voter) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = voters_.find(key(ballot, voter));
                if (it == voters_.end()) {
                    return std::nullopt;
                }
                return it->second;
            }

            std::optional<vote_location> locate(const std::string &secret) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = secrets_.find(secret);
                if (it == secrets_.end()) {
                    return std::nullopt;
                }
                return it->second;
            }

            /// Replaces the voter's receipt, the previous secret stops being valid.
            void bind(const std::string &voter, const receipt &r) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (purged_.count(r.location.assembly)) {
                    BOOST_THROW_EXCEPTION(ballot_state_error("Secrets of assembly '" + r.location.assembly +
                                                             "' are already purged."));
                }
                auto &slot = voters_[key(r.location.ballot, voter)];
                if (!slot.secret.empty()) {
                    secrets_.erase(slot.secret);
                }
                slot = r;
                secrets_[r.secret] = r.location;
            }

            /// Deletes every secret of an assembly for good, returns how many were dropped.
            std::size_t purge(const std::string &assembly) {
                std::lock_guard<std::mutex> lock(mutex_);
                purged_.insert(assembly);
                std::size_t dropped = 0;
                for (auto it = voters_.begin(); it != voters_.end();) {
                    if (it->second.location.assembly == assembly) {
                        secrets_.erase(it->second.secret);
                        it = voters_.erase(it);
                        ++dropped;
                    } else {
                        ++it;
                    }
                }
                return dropped;
            }

            std::size_t size() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return secrets_.size();
            }

            /// (voter, receipt) pairs, for persisting the registry.
            std::vector<std::pair<std::string, receipt>> snapshot() const {
                std::lock_guard<std::mutex> lock(mutex_);
                std::vector<std::pair<std::string, receipt>> entries;
                for (const auto &entry : voters_) {
                    entries.emplace_back(voter_of(entry.first), entry.second);
                }
                return entries;
            }

        private:
            static std::string key(const std::string &ballot, const std::string &voter) {
                return ballot + '\n' + voter;
            }

            static std::string voter_of(const std::string &k) {
                return k.substr(k.find('\n') + 1);
            }

            mutable std::mutex mutex_;
            voter_map voters_;
            std::map<std::string, vote_location> secrets_;
            std::set<std::string> purged_;
        };

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_RECEIPT_HPP
