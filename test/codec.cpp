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

#define BOOST_TEST_MODULE assembly_tally_codec_test

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/codec.hpp>
#include <assembly/tally/preference.hpp>
#include <assembly/tally/status.hpp>

using namespace assembly::tally;

namespace {
    candidate_set make_candidates(bool use_bar) {
        return candidate_set({{"Charly", "Charly C. Clown"},
                              {"Anton", "Anton Armin A. Administrator"},
                              {"Berta", "Bertålotta Beispiel"},
                              {"Emilia", "Emilia E. Eventis"}},
                             use_bar);
    }

    vote_status parse(const std::string &raw, const candidate_set &candidates, std::string &canonical) {
        preference_partition vote;
        vote_status status = parse_preferential(raw, candidates, vote);
        if (status == vote_status::success) {
            canonical = to_string(vote, candidates);
        }
        return status;
    }

    const std::vector<std::string> valid_votes = {
        "Anton>Berta>Charly>Emilia>_bar_",
        "Anton=Berta=Charly=Emilia=_bar_",
        "_bar_>Anton=Berta=Charly=Emilia",
        "Anton=_bar_>Berta>Charly=Emilia",
        "Emilia>Charly>Berta>Anton>_bar_",
        "Berta=Charly>Anton=Emilia=_bar_",
    };
}    // namespace

BOOST_AUTO_TEST_SUITE(candidate_set_test_suite)

BOOST_AUTO_TEST_CASE(candidate_set_display_order) {
    candidate_set candidates = make_candidates(true);
    BOOST_CHECK_EQUAL(candidates.size(), 5);
    BOOST_CHECK_EQUAL(candidates.candidate_count(), 4);
    BOOST_CHECK_EQUAL(candidates.shortname(0), "Anton");
    BOOST_CHECK_EQUAL(candidates.shortname(3), "Emilia");
    BOOST_CHECK_EQUAL(candidates.shortname(candidates.bar_index()), bar_shortname);
    BOOST_CHECK(candidates.is_bar(4));
    BOOST_CHECK(!candidate_set(candidates.candidates(), false).is_bar(4));
    BOOST_CHECK(!candidates.index_of("Dieter"));
    BOOST_CHECK_EQUAL(*candidates.index_of("Charly"), 2);
}

BOOST_AUTO_TEST_CASE(candidate_set_rejects_invalid_names) {
    BOOST_CHECK_THROW(candidate_set({{"A", ""}, {"A", "again"}}, false), std::invalid_argument);
    BOOST_CHECK_THROW(candidate_set({{"", ""}}, false), std::invalid_argument);
    BOOST_CHECK_THROW(candidate_set({{"_bar_", ""}}, true), std::invalid_argument);
    BOOST_CHECK_THROW(candidate_set({{"A>B", ""}}, false), std::invalid_argument);
    BOOST_CHECK_THROW(candidate_set({{"A=B", ""}}, false), std::invalid_argument);
    BOOST_CHECK_THROW(candidate_set({{"A B", ""}}, false), std::invalid_argument);
    BOOST_CHECK_NO_THROW(candidate_set({{"A.1", ""}, {"A-2", ""}}, false));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(vote_codec_test_suite)

BOOST_DATA_TEST_CASE(preferential_vote_is_canonical, boost::unit_test::data::make(valid_votes), raw) {
    candidate_set candidates = make_candidates(true);
    std::string canonical;
    BOOST_REQUIRE(parse(raw, candidates, canonical) == vote_status::success);
    BOOST_CHECK_EQUAL(canonical, raw);

    preference_partition first;
    preference_partition second;
    BOOST_REQUIRE(parse_preferential(raw, candidates, first) == vote_status::success);
    BOOST_REQUIRE(parse_preferential(canonical, candidates, second) == vote_status::success);
    BOOST_CHECK(first == second);

    std::vector<std::size_t> seen(candidates.size(), 0);
    for (const auto &level : first.levels()) {
        BOOST_CHECK(!level.empty());
        for (std::size_t idx : level) {
            ++seen[idx];
        }
    }
    for (std::size_t count : seen) {
        BOOST_CHECK_EQUAL(count, 1);
    }
}

BOOST_AUTO_TEST_CASE(preferential_vote_is_normalized) {
    candidate_set candidates = make_candidates(true);
    std::string canonical;
    BOOST_CHECK(parse("  Emilia = Anton > _bar_=Charly>Berta \n", candidates, canonical) == vote_status::success);
    BOOST_CHECK_EQUAL(canonical, "Anton=Emilia>Charly=_bar_>Berta");
}

BOOST_AUTO_TEST_CASE(preferential_vote_empty_is_abstention) {
    candidate_set candidates = make_candidates(true);
    std::string canonical;
    BOOST_CHECK(parse("", candidates, canonical) == vote_status::success);
    BOOST_CHECK_EQUAL(canonical, "Anton=Berta=Charly=Emilia=_bar_");
    BOOST_CHECK(parse("   ", candidates, canonical) == vote_status::success);
    BOOST_CHECK_EQUAL(canonical, "Anton=Berta=Charly=Emilia=_bar_");
}

BOOST_AUTO_TEST_CASE(preferential_vote_rejections) {
    candidate_set with_bar = make_candidates(true);
    candidate_set without_bar = make_candidates(false);
    std::string canonical;

    BOOST_CHECK(parse("Anton>>Berta>Charly>Emilia>_bar_", with_bar, canonical) == vote_status::empty_token);
    BOOST_CHECK(parse("Anton=Berta>Charly>Emilia=", without_bar, canonical) == vote_status::empty_token);
    BOOST_CHECK(parse("Anton>Berta>Charly>Dieter>Emilia>_bar_", with_bar, canonical) ==
                vote_status::unknown_candidate);
    BOOST_CHECK(parse("Anton>Berta>Charly>Emilia>_bar_", without_bar, canonical) ==
                vote_status::unknown_candidate);
    BOOST_CHECK(parse("Anton>Berta>Charly>Emilia>Anton>_bar_", with_bar, canonical) ==
                vote_status::duplicate_candidate);
    BOOST_CHECK(parse("Anton>Berta>Charly>Emilia", with_bar, canonical) == vote_status::incomplete_ranking);
    BOOST_CHECK(parse("anton>Berta>Charly>Emilia", without_bar, canonical) == vote_status::unknown_candidate);
}

BOOST_AUTO_TEST_CASE(status_messages_are_distinct) {
    const std::vector<vote_status> statuses = {
        vote_status::success,           vote_status::empty_token,        vote_status::unknown_candidate,
        vote_status::duplicate_candidate, vote_status::incomplete_ranking, vote_status::too_many_selections,
        vote_status::reject_conflict,   vote_status::bar_unavailable,    vote_status::too_many_levels,
        vote_status::misplaced_bar,     vote_status::wrong_mode,         vote_status::ambiguous_legacy_vote};
    std::set<std::string> messages;
    for (vote_status status : statuses) {
        messages.insert(status_message(status));
    }
    BOOST_CHECK_EQUAL(messages.size(), statuses.size());
}

BOOST_AUTO_TEST_SUITE_END()
