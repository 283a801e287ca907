#include "recs/Errors.hpp"
#include "recs/Ranker.hpp"
#include "recs/SimilarityIndex.hpp"

#include "TestCorpus.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

using recs::ScoredRecord;
using recs::SimilarityIndex;
using testutil::make_movie;

namespace {

std::vector<std::int64_t> ids_of(const std::vector<ScoredRecord>& hits) {
    std::vector<std::int64_t> out;
    for (const auto& h : hits) out.push_back(h.record_id);
    return out;
}

void expect_ranked(const std::vector<ScoredRecord>& hits) {
    for (size_t i = 1; i < hits.size(); ++i) {
        const auto& a = hits[i - 1];
        const auto& b = hits[i];
        EXPECT_TRUE(a.score > b.score || (a.score == b.score && a.record_id < b.record_id))
            << "position " << i;
    }
}

}  // namespace

TEST(RankerTest, SharedTermsAndGenreRankAboveUnrelatedRecord) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());
    const auto hits = recs::rank_by_record(idx, 1, 2);

    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].record_id, 3);
    EXPECT_EQ(hits[1].record_id, 2);
    EXPECT_GT(hits[0].score, hits[1].score);
    EXPECT_DOUBLE_EQ(hits[1].score, 0.0);

    // space, war (tf 2 / 1, idf 1) and SciFi (1.2)
    const double w2 = 1.0 + std::log(2.0);
    const double expected = (w2 * w2 + w2 + 1.44)
        / (std::sqrt(2 * w2 * w2 + 1.44) * std::sqrt(w2 * w2 + 3.0 + 2 * 1.44));
    EXPECT_NEAR(hits[0].score, expected, 1e-9);
}

TEST(RankerTest, RecordIsNeverInItsOwnResults) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());

    for (std::int64_t id : {1, 2, 3}) {
        for (const auto& h : recs::rank_by_record(idx, id, 10)) {
            EXPECT_NE(h.record_id, id);
        }
    }
}

TEST(RankerTest, QueryMatchesLexicalOverlapAndOmitsZeroScores) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());
    const auto hits = recs::rank_by_query(idx, "space battle", 5);

    EXPECT_EQ(ids_of(hits), (std::vector<std::int64_t>{1, 3}));
    expect_ranked(hits);
    for (const auto& h : hits) EXPECT_GT(h.score, 0.0);
}

TEST(RankerTest, EmptyOrUnknownQueryYieldsNoResults) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());

    EXPECT_TRUE(recs::rank_by_query(idx, "", 5).empty());
    EXPECT_TRUE(recs::rank_by_query(idx, "the and of", 5).empty());
    EXPECT_TRUE(recs::rank_by_query(idx, "zeppelin", 5).empty());
    EXPECT_TRUE(recs::rank_by_query(idx, "", {"Western"}, 5).empty());
}

TEST(RankerTest, UnknownRecordThrowsNotFound) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());

    EXPECT_THROW(recs::rank_by_record(idx, 999, 5), recs::NotFoundError);
    EXPECT_THROW(recs::rank_by_record(idx, 999, 0), recs::NotFoundError);
}

TEST(RankerTest, NonPositiveTopNGivesEmptyList) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());

    EXPECT_TRUE(recs::rank_by_record(idx, 1, 0).empty());
    EXPECT_TRUE(recs::rank_by_record(idx, 1, -3).empty());
    EXPECT_TRUE(recs::rank_by_query(idx, "space", 0).empty());
    EXPECT_TRUE(recs::rank_by_query(idx, "space", -1).empty());
}

TEST(RankerTest, TruncatesToTopN) {
    std::vector<catalog::Movie> corpus;
    for (int i = 1; i <= 100; ++i) {
        corpus.push_back(make_movie(i, "Movie " + std::to_string(i), {"Drama"},
                                    "shared plot words plus marker" + std::to_string(i % 7)));
    }
    const auto idx = SimilarityIndex::build(corpus);

    const auto hits = recs::rank_by_record(idx, 1, 3);
    EXPECT_EQ(hits.size(), 3u);
    expect_ranked(hits);

    EXPECT_EQ(recs::rank_by_query(idx, "plot", 3).size(), 3u);
    EXPECT_EQ(recs::rank_by_record(idx, 1, 500).size(), 99u);
}

TEST(RankerTest, EqualScoresBreakTiesByAscendingId) {
    const auto idx = SimilarityIndex::build({
        make_movie(10, "Twin", {"Noir"}, "rain city detective"),
        make_movie(7, "Twin", {"Noir"}, "rain city detective"),
        make_movie(3, "Twin", {"Noir"}, "rain city detective"),
        make_movie(5, "Other", {}, "sunny beach"),
    });

    const auto by_record = recs::rank_by_record(idx, 10, 5);
    EXPECT_EQ(ids_of(by_record), (std::vector<std::int64_t>{3, 7, 5}));
    EXPECT_DOUBLE_EQ(by_record[0].score, by_record[1].score);

    const auto by_query = recs::rank_by_query(idx, "detective", 5);
    EXPECT_EQ(ids_of(by_query), (std::vector<std::int64_t>{3, 7, 10}));
}

TEST(RankerTest, ZeroVectorSourceScoresZeroAgainstEverything) {
    auto corpus = testutil::space_romance_corpus();
    corpus.push_back(make_movie(4, "The", {}, "of the and"));
    const auto idx = SimilarityIndex::build(corpus);

    const auto hits = recs::rank_by_record(idx, 4, 10);
    EXPECT_EQ(ids_of(hits), (std::vector<std::int64_t>{1, 2, 3}));
    for (const auto& h : hits) EXPECT_EQ(h.score, 0.0);

    for (const auto& h : recs::rank_by_record(idx, 1, 10)) {
        if (h.record_id == 4) EXPECT_EQ(h.score, 0.0);
    }
}

TEST(RankerTest, QueryGenresMatchTheGenreNamespace) {
    const auto idx = SimilarityIndex::build(testutil::space_romance_corpus());

    const auto hits = recs::rank_by_query(idx, "", {"Romance"}, 5);
    EXPECT_EQ(ids_of(hits), (std::vector<std::int64_t>{2, 3}));

    // text and genre together favour the record that has both
    const auto both = recs::rank_by_query(idx, "space", {"Romance"}, 5);
    ASSERT_FALSE(both.empty());
    EXPECT_EQ(both[0].record_id, 3);
    expect_ranked(both);
}

TEST(RankerTest, GenreTagDoesNotMatchSameWordInText) {
    const auto idx = SimilarityIndex::build({
        make_movie(1, "Action Hero", {}, "explosions"),
        make_movie(2, "Quiet Drama", {"action"}, "long walks"),
    });

    EXPECT_EQ(ids_of(recs::rank_by_query(idx, "action", 5)), (std::vector<std::int64_t>{1}));
    EXPECT_EQ(ids_of(recs::rank_by_query(idx, "", {"action"}, 5)), (std::vector<std::int64_t>{2}));
}

TEST(RankerTest, GenreWeightShiftsRanking) {
    const std::vector<catalog::Movie> corpus = {
        make_movie(1, "Base", {"Horror"}, "ship crew"),
        make_movie(2, "Words", {}, "ship crew"),
        make_movie(3, "Tag", {"Horror"}, "garden party"),
    };

    recs::IndexConfig light;
    light.genre_weight = 0.1;
    const auto a = recs::rank_by_record(SimilarityIndex::build(corpus, light), 1, 2);
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(a[0].record_id, 2);

    recs::IndexConfig heavy;
    heavy.genre_weight = 10.0;
    const auto b = recs::rank_by_record(SimilarityIndex::build(corpus, heavy), 1, 2);
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].record_id, 3);
}

TEST(RankerTest, EmptyIndexAnswersQueriesWithNothing) {
    const auto idx = SimilarityIndex::build({});

    EXPECT_TRUE(recs::rank_by_query(idx, "space", 5).empty());
    EXPECT_THROW(recs::rank_by_record(idx, 1, 5), recs::NotFoundError);
}
