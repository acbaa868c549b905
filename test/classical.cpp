//---------------------------------------------------------------------------//
// Copyright (c) 2022 The assembly_tally Authors
//
// MIT License
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//---------------------------------------------------------------------------//

#define BOOST_TEST_MODULE assembly_tally_classical_test

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/codec.hpp>
#include <assembly/tally/preference.hpp>
#include <assembly/tally/status.hpp>

using namespace assembly::tally;

namespace {
    ballot_config make_config(bool use_bar, std::size_t votes, vote_mode mode = vote_mode::classical) {
        return ballot_config {candidate_set({{"A", "Alpha"}, {"B", "Beta"}, {"C", "Gamma"}, {"D", "Delta"}}, use_bar),
                              mode, votes};
    }

    struct encoded {
        vote_status status;
        std::string vote;
    };

    encoded encode(const std::vector<std::string> &selected, bool reject_all, const ballot_config &config) {
        classical_selection selection;
        selection.selected = selected;
        selection.reject_all = reject_all;
        preference_partition vote;
        encoded out {encode_classical(selection, config, vote), std::string()};
        if (out.status == vote_status::success) {
            out.vote = to_string(vote, config.candidates);
        }
        return out;
    }

    encoded decode(const std::string &raw, const ballot_config &config) {
        preference_partition vote;
        encoded out {decode_vote(raw, config, vote), std::string()};
        if (out.status == vote_status::success) {
            out.vote = to_string(vote, config.candidates);
        }
        return out;
    }

    encoded import_legacy(const std::string &raw, const ballot_config &config, legacy_policy policy) {
        preference_partition vote;
        encoded out {import_legacy_classical(raw, config, policy, vote), std::string()};
        if (out.status == vote_status::success) {
            out.vote = to_string(vote, config.candidates);
        }
        return out;
    }
}    // namespace

BOOST_AUTO_TEST_SUITE(classical_vote_test_suite)

BOOST_AUTO_TEST_CASE(classical_three_of_four_with_bar) {
    ballot_config config = make_config(true, 3);

    encoded subset = encode({"A", "B", "D"}, false, config);
    BOOST_REQUIRE(subset.status == vote_status::success);
    BOOST_CHECK_EQUAL(subset.vote, "A=B=D>C=_bar_");

    encoded nothing = encode({}, false, config);
    BOOST_REQUIRE(nothing.status == vote_status::success);
    BOOST_CHECK_EQUAL(nothing.vote, "A=B=C=D=_bar_");

    encoded everyone = encode({"D", "C", "B", "A"}, false, config);
    BOOST_REQUIRE(everyone.status == vote_status::success);
    BOOST_CHECK_EQUAL(everyone.vote, "A=B=C=D>_bar_");

    encoded rejection = encode({}, true, config);
    BOOST_REQUIRE(rejection.status == vote_status::success);
    BOOST_CHECK_EQUAL(rejection.vote, "_bar_>A=B=C=D");
}

BOOST_AUTO_TEST_CASE(classical_full_set_differs_from_abstention) {
    ballot_config config = make_config(true, 1);
    BOOST_CHECK_NE(encode({"A", "B", "C", "D"}, false, config).vote, encode({}, false, config).vote);
}

BOOST_AUTO_TEST_CASE(classical_reject_all_with_selection_is_rejected) {
    ballot_config config = make_config(true, 4);
    BOOST_CHECK(encode({"A"}, true, config).status == vote_status::reject_conflict);
    BOOST_CHECK(encode({"A", "B", "C", "D"}, true, config).status == vote_status::reject_conflict);
    BOOST_CHECK(encode({}, true, make_config(false, 4)).status == vote_status::bar_unavailable);
}

BOOST_AUTO_TEST_CASE(classical_selection_rejections) {
    ballot_config config = make_config(true, 2);
    BOOST_CHECK(encode({"A", "B", "D"}, false, config).status == vote_status::too_many_selections);
    BOOST_CHECK(encode({"A", "E"}, false, config).status == vote_status::unknown_candidate);
    BOOST_CHECK(encode({"_bar_"}, false, config).status == vote_status::unknown_candidate);
    BOOST_CHECK(encode({"A", "A"}, false, config).status == vote_status::duplicate_candidate);
    BOOST_CHECK(encode({"A"}, false, make_config(true, 2, vote_mode::preferential)).status ==
                vote_status::wrong_mode);
}

BOOST_AUTO_TEST_CASE(classical_without_bar) {
    ballot_config config = make_config(false, 2);
    BOOST_CHECK_EQUAL(encode({"C"}, false, config).vote, "C>A=B=D");
    BOOST_CHECK_EQUAL(encode({}, false, config).vote, "A=B=C=D");
    BOOST_CHECK(encode({"A", "B", "C"}, false, config).status == vote_status::too_many_selections);
    BOOST_CHECK(encode({"A", "B", "C", "D"}, false, config).status == vote_status::too_many_selections);
    BOOST_CHECK_EQUAL(encode({"A", "B", "C", "D"}, false, make_config(false, 4)).vote, "A=B=C=D");
}

BOOST_AUTO_TEST_CASE(classical_vote_strings) {
    ballot_config config = make_config(true, 3);
    BOOST_CHECK_EQUAL(decode("A=B=C>D=_bar_", config).vote, "A=B=C>D=_bar_");
    BOOST_CHECK_EQUAL(decode("_bar_>A=B=C=D", config).vote, "_bar_>A=B=C=D");
    BOOST_CHECK_EQUAL(decode("A=B=C=D>_bar_", config).vote, "A=B=C=D>_bar_");
    BOOST_CHECK_EQUAL(decode("A=B=C=D=_bar_", config).vote, "A=B=C=D=_bar_");
    BOOST_CHECK(decode("A>B>C=D=_bar_", config).status == vote_status::too_many_levels);
    BOOST_CHECK(decode("A=_bar_>B=C=D", config).status == vote_status::misplaced_bar);
    BOOST_CHECK(decode("A=B=C>D=_bar_", make_config(true, 2)).status == vote_status::too_many_selections);
}

BOOST_AUTO_TEST_CASE(classical_legacy_import) {
    ballot_config config = make_config(true, 2);
    BOOST_CHECK_EQUAL(import_legacy("A=B>C=D", config, legacy_policy::unresolvable).vote, "A=B>C=D=_bar_");
    BOOST_CHECK(import_legacy("A=B=C=D", config, legacy_policy::unresolvable).status ==
                vote_status::ambiguous_legacy_vote);
    BOOST_CHECK_EQUAL(import_legacy("A=B=C=D", config, legacy_policy::abstention).vote, "A=B=C=D=_bar_");
    BOOST_CHECK_EQUAL(import_legacy("A=B=C=D", config, legacy_policy::approval).vote, "A=B=C=D>_bar_");
    BOOST_CHECK_EQUAL(import_legacy("_bar_>A=B=C=D", config, legacy_policy::unresolvable).vote, "_bar_>A=B=C=D");
    BOOST_CHECK(import_legacy("A>B>C=D", config, legacy_policy::abstention).status == vote_status::too_many_levels);
    BOOST_CHECK_EQUAL(import_legacy("A=B=C=D", make_config(false, 2), legacy_policy::unresolvable).vote, "A=B=C=D");
    BOOST_CHECK(import_legacy("A=B=C=D", make_config(true, 2, vote_mode::preferential), legacy_policy::approval).status ==
                vote_status::wrong_mode);
}

BOOST_AUTO_TEST_SUITE_END()
