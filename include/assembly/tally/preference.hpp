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

#ifndef ASSEMBLY_TALLY_PREFERENCE_HPP
#define ASSEMBLY_TALLY_PREFERENCE_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include <boost/assert.hpp>

#include <assembly/tally/candidate_set.hpp>

namespace assembly {
    namespace tally {

        /*!
         * @brief Total preorder over the vote positions of a ballot.
         *
         * Levels are ordered from most to least preferred, candidates inside
         * a level are tied. Members of a level are kept sorted by index so two
         * partitions expressing the same preorder compare equal.
         */
        class preference_partition {
        public:
            typedef std::vector<std::size_t> level_type;

            preference_partition() = default;

            explicit preference_partition(std::vector<level_type> levels) : levels_(std::move(levels)) {
                levels_.erase(std::remove_if(levels_.begin(), levels_.end(),
                                             [](const level_type &level) { return level.empty(); }),
                              levels_.end());
                for (auto &level : levels_) {
                    std::sort(level.begin(), level.end());
                }
            }

            const std::vector<level_type> &levels() const {
                return levels_;
            }

            std::size_t size() const {
                return levels_.size();
            }

            bool empty() const {
                return levels_.empty();
            }

            bool is_abstention() const {
                return levels_.size() == 1;
            }

            /// Level index of every vote position, lower is better.
            std::vector<std::size_t> ranks(std::size_t positions) const {
                std::vector<std::size_t> rank(positions, levels_.size());
                for (std::size_t level = 0; level < levels_.size(); ++level) {
                    for (std::size_t idx : levels_[level]) {
                        BOOST_ASSERT_MSG(idx < positions, "Vote position out of range");
                        rank[idx] = level;
                    }
                }
                return rank;
            }

            bool operator==(const preference_partition &other) const {
                return levels_ == other.levels_;
            }

            bool operator!=(const preference_partition &other) const {
                return !(*this == other);
            }

        private:
            std::vector<level_type> levels_;
        };

        inline std::string to_string(const preference_partition &partition, const candidate_set &candidates) {
            std::string out;
            for (std::size_t level = 0; level < partition.size(); ++level) {
                if (level > 0) {
                    out += '>';
                }
                const auto &members = partition.levels()[level];
                for (std::size_t i = 0; i < members.size(); ++i) {
                    if (i > 0) {
                        out += '=';
                    }
                    out += candidates.shortname(members[i]);
                }
            }
            return out;
        }

        /// Single level holding every vote position.
        inline preference_partition abstention(const candidate_set &candidates) {
            preference_partition::level_type all(candidates.size());
            for (std::size_t i = 0; i < all.size(); ++i) {
                all[i] = i;
            }
            std::vector<preference_partition::level_type> levels {all};
            return preference_partition(std::move(levels));
        }

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_PREFERENCE_HPP
