#include "recs/Vectorizer.hpp"
#include "recs/Vocabulary.hpp"

#include <gtest/gtest.h>

#include <cmath>

using recs::FeatureVector;
using recs::Vocabulary;

namespace {

// N = 2: idf(a) = ln(2/2) + 1 = 1, idf(b) = ln(2/3) + 1
Vocabulary ab_vocab() {
    return Vocabulary::build({{"a", "b"}, {"b"}}, {{"X"}, {}});
}

}  // namespace

TEST(VectorizerTest, WeightsAreLogTfTimesIdfPlusGenreWeight) {
    const Vocabulary v = ab_vocab();
    const FeatureVector fv = recs::vectorize({"a", "a", "b"}, {"X"}, v, 1.2);

    const double wa = (1.0 + std::log(2.0)) * 1.0;
    const double wb = 1.0 * (std::log(2.0 / 3.0) + 1.0);
    const double wx = 1.2;
    const double n = std::sqrt(wa * wa + wb * wb + wx * wx);

    ASSERT_EQ(fv.weights.size(), 3u);
    EXPECT_NEAR(fv.weight_at(v.term_id("a")), wa / n, 1e-12);
    EXPECT_NEAR(fv.weight_at(v.term_id("b")), wb / n, 1e-12);
    EXPECT_NEAR(fv.weight_at(v.genre_dim("X")), wx / n, 1e-12);
}

TEST(VectorizerTest, OutputIsSortedAndUnitLength) {
    const Vocabulary v = ab_vocab();
    const FeatureVector fv = recs::vectorize({"b", "a", "b"}, {"X"}, v, 1.2);

    for (size_t i = 1; i < fv.weights.size(); ++i) {
        EXPECT_LT(fv.weights[i - 1].first, fv.weights[i].first);
    }
    EXPECT_NEAR(fv.norm(), 1.0, 1e-9);
}

TEST(VectorizerTest, RepeatedGenreCountsOnce) {
    const Vocabulary v = ab_vocab();
    const FeatureVector once = recs::vectorize({"a"}, {"X"}, v, 1.2);
    const FeatureVector twice = recs::vectorize({"a"}, {"X", "X"}, v, 1.2);

    ASSERT_EQ(once.weights.size(), twice.weights.size());
    for (size_t i = 0; i < once.weights.size(); ++i) {
        EXPECT_EQ(once.weights[i].first, twice.weights[i].first);
        EXPECT_DOUBLE_EQ(once.weights[i].second, twice.weights[i].second);
    }
}

TEST(VectorizerTest, UnknownTermsAndGenresAreDropped) {
    const Vocabulary v = ab_vocab();

    EXPECT_TRUE(recs::vectorize({"zzz"}, {"Western"}, v, 1.2).is_zero());
    EXPECT_TRUE(recs::vectorize({}, {}, v, 1.2).is_zero());

    const FeatureVector fv = recs::vectorize({"a", "zzz"}, {}, v, 1.2);
    ASSERT_EQ(fv.weights.size(), 1u);
    EXPECT_NEAR(fv.weights[0].second, 1.0, 1e-12);
}

TEST(VectorizerTest, ZeroGenreWeightLeavesGenresOut) {
    const Vocabulary v = ab_vocab();

    EXPECT_TRUE(recs::vectorize({}, {"X"}, v, 0.0).is_zero());

    const FeatureVector fv = recs::vectorize({"a"}, {"X"}, v, 0.0);
    ASSERT_EQ(fv.weights.size(), 1u);
    EXPECT_EQ(fv.weights[0].first, (uint32_t)v.term_id("a"));
}

TEST(VectorizerTest, NormalizingZeroVectorKeepsItZero) {
    FeatureVector z;
    recs::l2_normalize(z);
    EXPECT_TRUE(z.is_zero());
    EXPECT_EQ(z.norm(), 0.0);

    FeatureVector fv;
    fv.weights = {{0, 3.0}, {4, 4.0}};
    recs::l2_normalize(fv);
    EXPECT_DOUBLE_EQ(fv.weights[0].second, 0.6);
    EXPECT_DOUBLE_EQ(fv.weights[1].second, 0.8);
}

TEST(VectorizerTest, DenseAndSparseDotsAgree) {
    FeatureVector a;
    a.weights = {{0, 0.6}, {2, 0.8}};
    FeatureVector b;
    b.weights = {{1, 0.5}, {2, 0.5}, {5, 0.70710678}};

    const double sparse = recs::dot(a, b);
    EXPECT_DOUBLE_EQ(sparse, 0.4);
    EXPECT_DOUBLE_EQ(recs::dot_dense(recs::to_dense(a, 6), b), sparse);
    EXPECT_DOUBLE_EQ(recs::dot(a, FeatureVector{}), 0.0);
}

TEST(VectorizerTest, NormalizingHugeWeightsStaysFinite) {
    FeatureVector fv;
    fv.weights = {{0, 1e200}, {3, 1.0}, {5, 1e200}};
    EXPECT_TRUE(std::isfinite(fv.norm()));

    recs::l2_normalize(fv);
    ASSERT_EQ(fv.weights.size(), 3u);
    EXPECT_FALSE(fv.is_zero());
    EXPECT_NEAR(fv.norm(), 1.0, 1e-12);
    EXPECT_NEAR(fv.weights[0].second, std::sqrt(0.5), 1e-12);
    EXPECT_GT(fv.weights[1].second, 0.0);
}

TEST(VectorizerTest, WeightsThatUnderflowAreDropped) {
    FeatureVector fv;
    fv.weights = {{0, 1e300}, {1, 1e-300}};

    recs::l2_normalize(fv);
    ASSERT_EQ(fv.weights.size(), 1u);
    EXPECT_EQ(fv.weights[0].first, 0u);
    EXPECT_DOUBLE_EQ(fv.weights[0].second, 1.0);
}

TEST(VectorizerTest, HugeGenreWeightStillYieldsUnitVector) {
    const Vocabulary v = ab_vocab();
    const FeatureVector fv = recs::vectorize({"a", "b"}, {"X"}, v, 1e300);

    EXPECT_FALSE(fv.is_zero());
    EXPECT_NEAR(fv.norm(), 1.0, 1e-9);
}
