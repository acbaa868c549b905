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

#ifndef ASSEMBLY_TALLY_VOTE_STORE_HPP
#define ASSEMBLY_TALLY_VOTE_STORE_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <assembly/tally/receipt.hpp>

namespace assembly {
    namespace tally {

        struct ledger_entry {
            std::string ballot;
            std::string key;
            vote_record record;
        };

        /*!
         * @brief Keyed vote ledger, (ballot, storage key) -> vote record.
         *
         * Entries are spread over a fixed number of shards, a write locks
         * only the shard its key hashes to.
         */
        template<std::size_t ShardCount = 16>
        class basic_vote_store {
            static_assert(ShardCount > 0, "Vote store needs at least one shard");

        public:
            typedef std::pair<std::string, std::string> key_type;

            void put(const std::string &ballot, const std::string &key, const vote_record &record) {
                shard &s = shard_of(key);
                std::lock_guard<std::mutex> lock(s.mutex);
                s.entries[{ballot, key}] = record;
            }

            std::optional<vote_record> get(const std::string &ballot, const std::string &key) const {
                const shard &s = shard_of(key);
                std::lock_guard<std::mutex> lock(s.mutex);
                auto it = s.entries.find({ballot, key});
                if (it == s.entries.end()) {
                    return std::nullopt;
                }
                return it->second;
            }

            /// Every record of a ballot, in no particular order.
            std::vector<vote_record> ballot_votes(const std::string &ballot) const {
                std::vector<vote_record> records;
                for (const auto &s : shards_) {
                    std::lock_guard<std::mutex> lock(s.mutex);
                    for (auto it = s.entries.lower_bound({ballot, std::string()});
                         it != s.entries.end() && it->first.first == ballot; ++it) {
                        records.push_back(it->second);
                    }
                }
                return records;
            }

            /// Every entry of the store, for persisting the ledger.
            std::vector<ledger_entry> entries() const {
                std::vector<ledger_entry> all;
                for (const auto &s : shards_) {
                    std::lock_guard<std::mutex> lock(s.mutex);
                    for (const auto &entry : s.entries) {
                        all.push_back({entry.first.first, entry.first.second, entry.second});
                    }
                }
                return all;
            }

            std::size_t size() const {
                std::size_t total = 0;
                for (const auto &s : shards_) {
                    std::lock_guard<std::mutex> lock(s.mutex);
                    total += s.entries.size();
                }
                return total;
            }

        private:
            struct shard {
                mutable std::mutex mutex;
                std::map<key_type, vote_record> entries;
            };

            shard &shard_of(const std::string &key) {
                return shards_[std::hash<std::string>()(key) % ShardCount];
            }

            const shard &shard_of(const std::string &key) const {
                return shards_[std::hash<std::string>()(key) % ShardCount];
            }

            std::array<shard, ShardCount> shards_;
        };

        typedef basic_vote_store<> vote_store;

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_VOTE_STORE_HPP
