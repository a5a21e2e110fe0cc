#include <gtest/gtest.h>

#include "trophdiv/alg/TrophicIndices.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace trophdiv;
using trophdiv::alg::compute_community;
using trophdiv::alg::round3;
using trophdiv::alg::trophic_evenness;

namespace {

constexpr double kTol = 1e-12;

CommunityIndices must_compute(const std::vector<double>& a, const std::vector<double>& t) {
    auto ci = compute_community(a, t);
    EXPECT_TRUE(ci.has_value());
    return ci.value_or(CommunityIndices{});
}

}  // namespace

// Two of three species present at levels 2 and 4.
TEST(TrophicIndices, TwoPresentSpecies) {
    const auto ci = must_compute({10, 0, 5}, {2.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(ci.abtot, 15.0);
    EXPECT_EQ(ci.nbsp, 2u);
    EXPECT_EQ(ci.nbtl, 2u);
    EXPECT_DOUBLE_EQ(ci.mintl, 2.0);
    EXPECT_DOUBLE_EQ(ci.maxtl, 4.0);
    EXPECT_DOUBLE_EQ(ci.rgetl, 2.0);
    EXPECT_NEAR(ci.meantl, 2.667, kTol);
    EXPECT_NEAR(ci.sdtl, 0.942, kTol);
    EXPECT_NEAR(ci.FDvar, 0.312, kTol);
    EXPECT_FALSE(ci.FROm.has_value());
}

TEST(TrophicIndices, SingleSpecies) {
    const auto ci = must_compute({0, 20, 0}, {2.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(ci.abtot, 20.0);
    EXPECT_EQ(ci.nbsp, 1u);
    EXPECT_EQ(ci.nbtl, 1u);
    EXPECT_DOUBLE_EQ(ci.mintl, 3.0);
    EXPECT_DOUBLE_EQ(ci.maxtl, 3.0);
    EXPECT_DOUBLE_EQ(ci.meantl, 3.0);
    EXPECT_DOUBLE_EQ(ci.rgetl, 0.0);
    EXPECT_DOUBLE_EQ(ci.sdtl, 0.0);
    EXPECT_DOUBLE_EQ(ci.FDvar, 0.0);
    EXPECT_FALSE(ci.FROm.has_value());
}

// Evenly spaced levels with equal abundances are perfectly even.
TEST(TrophicIndices, EvenSpacingEqualAbundanceGivesFromOne) {
    const auto ci = must_compute({5, 5, 5}, {2.0, 3.0, 4.0});
    EXPECT_EQ(ci.nbtl, 3u);
    EXPECT_NEAR(ci.meantl, 3.0, kTol);
    EXPECT_NEAR(ci.sdtl, 0.816, kTol);
    EXPECT_NEAR(ci.FDvar, 0.245, kTol);
    ASSERT_TRUE(ci.FROm.has_value());
    EXPECT_NEAR(*ci.FROm, 1.0, kTol);
}

TEST(TrophicIndices, UnevenCommunity) {
    const auto ci = must_compute({1, 1, 2}, {2.0, 3.0, 5.0});
    EXPECT_NEAR(ci.meantl, 3.75, kTol);
    EXPECT_NEAR(ci.sdtl, 1.299, kTol);
    EXPECT_NEAR(ci.FDvar, 0.405, kTol);
    ASSERT_TRUE(ci.FROm.has_value());
    EXPECT_NEAR(*ci.FROm, 0.857, kTol);
}

TEST(TrophicIndices, FourLevels) {
    const auto ci = must_compute({10, 20, 30, 40}, {2.1, 2.8, 3.5, 4.4});
    EXPECT_DOUBLE_EQ(ci.abtot, 100.0);
    EXPECT_EQ(ci.nbtl, 4u);
    EXPECT_NEAR(ci.rgetl, 2.3, 1e-9);
    EXPECT_NEAR(ci.meantl, 3.58, kTol);
    EXPECT_NEAR(ci.sdtl, 0.782, kTol);
    EXPECT_NEAR(ci.FDvar, 0.177, kTol);
    ASSERT_TRUE(ci.FROm.has_value());
    EXPECT_NEAR(*ci.FROm, 0.803, kTol);
}

// Species sharing a level count once in nbtl; ties keep input order in FROm.
TEST(TrophicIndices, TiedLevels) {
    const auto ci = must_compute({1, 2, 3, 4}, {3.0, 2.0, 3.0, 4.0});
    EXPECT_EQ(ci.nbsp, 4u);
    EXPECT_EQ(ci.nbtl, 3u);
    EXPECT_NEAR(ci.meantl, 3.2, kTol);
    EXPECT_NEAR(ci.sdtl, 0.748, kTol);
    EXPECT_NEAR(ci.FDvar, 0.2, kTol);
    ASSERT_TRUE(ci.FROm.has_value());
    EXPECT_NEAR(*ci.FROm, 0.45, 1e-9);
}

TEST(TrophicIndices, MissingAndZeroAbundancesAreNotPresent) {
    const double na = std::nan("");
    const auto ci = must_compute({na, 4, 0, 6}, {2.0, 3.0, 3.5, 4.0});
    EXPECT_DOUBLE_EQ(ci.abtot, 10.0);
    EXPECT_EQ(ci.nbsp, 2u);
    EXPECT_EQ(ci.nbtl, 2u);
    EXPECT_DOUBLE_EQ(ci.mintl, 3.0);
    EXPECT_DOUBLE_EQ(ci.maxtl, 4.0);
    EXPECT_NEAR(ci.meantl, 3.6, kTol);
    EXPECT_FALSE(ci.FROm.has_value());
}

TEST(TrophicIndices, NoPresentSpeciesYieldsNothing) {
    const double na = std::nan("");
    EXPECT_FALSE(compute_community(std::vector<double>{0, na, 0}, std::vector<double>{2, 3, 4}).has_value());
    EXPECT_FALSE(compute_community(std::vector<double>{}, std::vector<double>{}).has_value());
}

// Rounding the mean up can make the variance term slightly negative.
TEST(TrophicIndices, NegativeRadicandClampsToZero) {
    const auto ci = must_compute({1}, {1.0006});
    EXPECT_NEAR(ci.meantl, 1.001, kTol);
    EXPECT_FALSE(std::isnan(ci.sdtl));
    EXPECT_DOUBLE_EQ(ci.sdtl, 0.0);
}

TEST(TrophicIndices, SizeMismatchThrows) {
    EXPECT_THROW(compute_community(std::vector<double>{1, 2}, std::vector<double>{2}), std::invalid_argument);
}

TEST(TrophicEvenness, UndefinedBelowThreeLevels) {
    EXPECT_FALSE(trophic_evenness(std::vector<double>{1, 1, 1}, std::vector<double>{2, 2, 3}).has_value());
    EXPECT_TRUE(trophic_evenness(std::vector<double>{1, 1, 1}, std::vector<double>{2, 2.5, 3}).has_value());
}

TEST(Round3, ThreeDecimals) {
    EXPECT_DOUBLE_EQ(round3(2.6666666), 2.667);
    EXPECT_DOUBLE_EQ(round3(0.1234), 0.123);
    EXPECT_DOUBLE_EQ(round3(3.0), 3.0);
    EXPECT_EQ(round3(-0.0001), 0.0);
    EXPECT_FALSE(std::signbit(round3(-0.0001)));
}
