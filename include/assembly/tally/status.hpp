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

#ifndef ASSEMBLY_TALLY_STATUS_HPP
#define ASSEMBLY_TALLY_STATUS_HPP

#include <ostream>
#include <stdexcept>
#include <string>

#include <boost/exception/exception.hpp>

namespace assembly {
    namespace tally {

        /*!
         * @brief Outcome of decoding a single vote.
         *
         * Everything except success is a rejection that is reported back to
         * the submitter as is. A rejected vote is never stored.
         */
        enum class vote_status {
            success,
            empty_token,
            unknown_candidate,
            duplicate_candidate,
            incomplete_ranking,
            too_many_selections,
            reject_conflict,
            bar_unavailable,
            too_many_levels,
            misplaced_bar,
            wrong_mode,
            ambiguous_legacy_vote
        };

        inline const char *status_message(vote_status status) {
            switch (status) {
                case vote_status::success:
                    return "Vote accepted.";
                case vote_status::empty_token:
                    return "Empty candidate between relation signs.";
                case vote_status::unknown_candidate:
                    return "Unknown candidate.";
                case vote_status::duplicate_candidate:
                    return "Duplicate candidate.";
                case vote_status::incomplete_ranking:
                    return "Incomplete ranking, candidates are missing.";
                case vote_status::too_many_selections:
                    return "Too many candidates selected.";
                case vote_status::reject_conflict:
                    return "Cannot select candidates and reject simultaneously.";
                case vote_status::bar_unavailable:
                    return "Rejection option not available.";
                case vote_status::too_many_levels:
                    return "Too many levels for a classical vote.";
                case vote_status::misplaced_bar:
                    return "Misplaced rejection option.";
                case vote_status::wrong_mode:
                    return "Vote format does not match the ballot.";
                case vote_status::ambiguous_legacy_vote:
                    return "Legacy vote cannot distinguish abstention from approval.";
            }
            return "Unknown status.";
        }

        inline std::ostream &operator<<(std::ostream &os, vote_status status) {
            return os << status_message(status);
        }

        /// Operation requested in the wrong lifecycle phase of a ballot or assembly.
        struct ballot_state_error : virtual boost::exception, std::logic_error {
            explicit ballot_state_error(const std::string &what) : std::logic_error(what) {
            }
        };

        /// Recomputing a published tally produced a different result.
        struct integrity_error : virtual boost::exception, std::runtime_error {
            explicit integrity_error(const std::string &what) : std::runtime_error(what) {
            }
        };

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_STATUS_HPP
