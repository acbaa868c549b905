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

#ifndef ASSEMBLY_TALLY_PAIRWISE_HPP
#define ASSEMBLY_TALLY_PAIRWISE_HPP

#include <cstddef>
#include <vector>

#include <assembly/tally/preference.hpp>

namespace assembly {
    namespace tally {

        /*!
         * @brief Directed pairwise preference counts.
         *
         * (*this)(a, b) is the number of votes ranking a strictly above b.
         */
        class pairwise_matrix {
        public:
            explicit pairwise_matrix(std::size_t positions) :
                positions_(positions), counts_(positions * positions, 0), vote_count_(0) {
            }

            std::size_t size() const {
                return positions_;
            }

            std::size_t vote_count() const {
                return vote_count_;
            }

            std::size_t operator()(std::size_t a, std::size_t b) const {
                return counts_[a * positions_ + b];
            }

            void add(const preference_partition &vote) {
                std::vector<std::size_t> rank = vote.ranks(positions_);
                for (std::size_t a = 0; a < positions_; ++a) {
                    for (std::size_t b = 0; b < positions_; ++b) {
                        if (rank[a] < rank[b]) {
                            ++counts_[a * positions_ + b];
                        }
                    }
                }
                ++vote_count_;
            }

        private:
            std::size_t positions_;
            std::vector<std::size_t> counts_;
            std::size_t vote_count_;
        };

        template<typename InputIterator>
        pairwise_matrix pairwise_preference(InputIterator first, InputIterator last, std::size_t positions) {
            pairwise_matrix d(positions);
            for (; first != last; ++first) {
                d.add(*first);
            }
            return d;
        }

        inline pairwise_matrix pairwise_preference(const std::vector<preference_partition> &votes,
                                                   std::size_t positions) {
            return pairwise_preference(votes.cbegin(), votes.cend(), positions);
        }

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_PAIRWISE_HPP
