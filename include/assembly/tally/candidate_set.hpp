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

#ifndef ASSEMBLY_TALLY_CANDIDATE_SET_HPP
#define ASSEMBLY_TALLY_CANDIDATE_SET_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/throw_exception.hpp>

namespace assembly {
    namespace tally {

        /// Reserved shortname of the synthetic rejection candidate.
        constexpr const char bar_shortname[] = "_bar_";

        struct candidate {
            std::string shortname;
            std::string title;
        };

        inline bool operator==(const candidate &a, const candidate &b) {
            return a.shortname == b.shortname && a.title == b.title;
        }

        /*!
         * @brief Fixed candidates of one ballot plus the optional bar.
         *
         * Candidates are indexed in display order, i.e. sorted by shortname.
         * If the bar is enabled it takes the last index, after all real
         * candidates, so every index in [0, size()) is a valid position in a
         * vote.
         */
        class candidate_set {
        public:
            candidate_set() = default;

            candidate_set(std::vector<candidate> candidates, bool use_bar) :
                candidates_(std::move(candidates)), use_bar_(use_bar) {
                std::sort(candidates_.begin(), candidates_.end(),
                          [](const candidate &a, const candidate &b) { return a.shortname < b.shortname; });
                for (std::size_t i = 0; i < candidates_.size(); ++i) {
                    const std::string &name = candidates_[i].shortname;
                    if (!is_valid_shortname(name)) {
                        BOOST_THROW_EXCEPTION(std::invalid_argument("Invalid candidate shortname '" + name + "'."));
                    }
                    if (!index_.emplace(name, i).second) {
                        BOOST_THROW_EXCEPTION(std::invalid_argument("Duplicate candidate shortname '" + name + "'."));
                    }
                }
                if (use_bar_) {
                    index_.emplace(bar_shortname, candidates_.size());
                }
            }

            /// Number of vote positions, the bar included.
            std::size_t size() const {
                return candidates_.size() + (use_bar_ ? 1 : 0);
            }

            /// Number of real candidates.
            std::size_t candidate_count() const {
                return candidates_.size();
            }

            const std::vector<candidate> &candidates() const {
                return candidates_;
            }

            bool use_bar() const {
                return use_bar_;
            }

            std::size_t bar_index() const {
                return candidates_.size();
            }

            bool is_bar(std::size_t idx) const {
                return use_bar_ && idx == bar_index();
            }

            const std::string &shortname(std::size_t idx) const {
                static const std::string bar(bar_shortname);
                return is_bar(idx) ? bar : candidates_.at(idx).shortname;
            }

            std::optional<std::size_t> index_of(const std::string &shortname) const {
                auto it = index_.find(shortname);
                if (it == index_.end()) {
                    return std::nullopt;
                }
                return it->second;
            }

            std::vector<std::string> shortnames() const {
                std::vector<std::string> names;
                names.reserve(size());
                for (std::size_t i = 0; i < size(); ++i) {
                    names.push_back(shortname(i));
                }
                return names;
            }

            static bool is_valid_shortname(const std::string &name) {
                if (name.empty() || name == bar_shortname) {
                    return false;
                }
                return std::none_of(name.begin(), name.end(), [](char c) {
                    return c == '>' || c == '=' || c == ',' || std::isspace(static_cast<unsigned char>(c));
                });
            }

        private:
            std::vector<candidate> candidates_;
            std::map<std::string, std::size_t> index_;
            bool use_bar_ = false;
        };

        enum class vote_mode { preferential, classical };

        inline const char *to_string(vote_mode mode) {
            return mode == vote_mode::classical ? "classical" : "preferential";
        }

        /// Tallying-relevant part of a ballot definition.
        struct ballot_config {
            candidate_set candidates;
            vote_mode mode = vote_mode::preferential;
            // number of selectable candidates, classical mode only
            std::size_t votes = 0;
        };

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_CANDIDATE_SET_HPP
