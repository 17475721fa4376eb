#include "criterion/EntropyCriterion.hpp"
#include "core/Errors.hpp"
#include "TestTables.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>

using namespace id3;

TEST(EntropyCriterionTest, PureCountsHaveZeroEntropy) {
    for (size_t n : {1u, 2u, 7u, 1000u}) {
        EXPECT_EQ(EntropyCriterion::entropyOfCounts({n}), 0.0);
    }
    // 零计数不参与
    EXPECT_EQ(EntropyCriterion::entropyOfCounts({0, 5, 0}), 0.0);
}

TEST(EntropyCriterionTest, EqualCountsReachLog2K) {
    for (size_t k = 2; k <= 9; ++k) {
        std::vector<size_t> counts(k, 4);
        EXPECT_NEAR(EntropyCriterion::entropyOfCounts(counts), std::log2(double(k)), 1e-9);
    }
}

TEST(EntropyCriterionTest, BoundedByLog2OfNonzeroGroups) {
    const std::vector<std::vector<size_t>> cases = {
        {1, 2}, {9, 1}, {3, 0, 3}, {1, 2, 3, 4}, {100, 1, 1}, {5, 5, 0, 10}};
    for (const auto& c : cases) {
        size_t k = 0;
        for (size_t v : c) if (v > 0) ++k;
        const double h = EntropyCriterion::entropyOfCounts(c);
        EXPECT_GE(h, 0.0);
        EXPECT_LE(h, std::log2(double(k)) + 1e-12);
    }
}

TEST(EntropyCriterionTest, ZeroTotalIsInvalid) {
    EXPECT_THROW(EntropyCriterion::entropyOfCounts({}), InvalidInputError);
    EXPECT_THROW(EntropyCriterion::entropyOfCounts({0, 0}), InvalidInputError);
}

TEST(EntropyCriterionTest, NodeMetricThroughInterface) {
    std::unique_ptr<ISplitCriterion> criterion = std::make_unique<EntropyCriterion>();
    EXPECT_NEAR(criterion->nodeMetric({3, 1}), 0.811278124459, 1e-9);
}

TEST(EntropyCriterionTest, SubsetEntropy) {
    auto t = fixtures::weatherTable();
    EXPECT_DOUBLE_EQ(EntropyCriterion::subsetEntropy(t, "Play"), 1.0);

    auto sunny = t.filterEquals("Weather", "Sunny");
    EXPECT_NEAR(EntropyCriterion::subsetEntropy(sunny, "Play"), 0.811278124459, 1e-9);
    EXPECT_DOUBLE_EQ(EntropyCriterion::subsetEntropy(sunny, "Play"),
                     EntropyCriterion::subsetEntropy(t, "Play", t.rowsWhere("Weather", "Sunny")));
}

TEST(EntropyCriterionTest, WeatherScenario) {
    auto t = fixtures::weatherTable();
    EXPECT_NEAR(EntropyCriterion::featureEntropy(t, "Weather", "Play"), 0.8113, 1e-4);
    EXPECT_NEAR(EntropyCriterion::informationGain(t, "Weather", "Play"),
                1.0 - 0.811278124459, 1e-9);
}

TEST(EntropyCriterionTest, PerfectSplitIsExactlyZero) {
    CategoricalTable t;
    t.addColumn("F", {"A", "B", "A", "B", "A"});
    t.addColumn("y", {"Yes", "No", "Yes", "No", "Yes"});
    EXPECT_EQ(EntropyCriterion::featureEntropy(t, "F", "y"), 0.0);
}

TEST(EntropyCriterionTest, PlayTennisTextbookValues) {
    auto t = fixtures::playTennisFeatures();
    auto y = fixtures::playTennisLabel();
    t.addColumn(y.name, y.values);

    EXPECT_NEAR(EntropyCriterion::subsetEntropy(t, y.name), 0.940286, 1e-6);
    EXPECT_NEAR(EntropyCriterion::informationGain(t, "Outlook", y.name), 0.246750, 1e-6);
    EXPECT_NEAR(EntropyCriterion::informationGain(t, "Humidity", y.name), 0.151836, 1e-6);
    EXPECT_NEAR(EntropyCriterion::informationGain(t, "Wind", y.name), 0.048127, 1e-6);
    EXPECT_NEAR(EntropyCriterion::informationGain(t, "Temperature", y.name), 0.029223, 1e-6);
}

TEST(EntropyCriterionTest, FeatureEntropyRejectsBadInput) {
    auto t = fixtures::weatherTable();
    EXPECT_THROW(EntropyCriterion::featureEntropy(t, "Weather", "Missing"), InvalidInputError);
    EXPECT_THROW(EntropyCriterion::featureEntropy(t, "Missing", "Play"), InvalidInputError);

    CategoricalTable empty;
    empty.addColumn("Weather", {});
    empty.addColumn("Play", {});
    EXPECT_THROW(EntropyCriterion::featureEntropy(empty, "Weather", "Play"), InvalidInputError);
}
