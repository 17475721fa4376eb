#include "functions/math/Probability.hpp"
#include "core/Errors.hpp"
#include "TestTables.hpp"
#include <gtest/gtest.h>

using namespace id3;

TEST(ProbabilityTest, RelativeFrequency) {
    auto t = fixtures::weatherTable();
    EXPECT_DOUBLE_EQ(probability(t, "Weather", "Sunny"), 0.5);
    EXPECT_DOUBLE_EQ(probability(t, "Play", "Yes"), 0.5);

    auto tennis = fixtures::playTennisFeatures();
    EXPECT_DOUBLE_EQ(probability(tennis, "Outlook", "Overcast"), 4.0 / 14.0);
}

TEST(ProbabilityTest, SumsToOneOverDistinctValues) {
    auto t = fixtures::playTennisFeatures();
    for (const auto& f : t.columnNames()) {
        double sum = 0.0;
        for (const auto& g : t.partition(f)) sum += probability(t, f, g.value);
        EXPECT_NEAR(sum, 1.0, 1e-9) << f;
    }
}

TEST(ProbabilityTest, UnknownFeatureOrValue) {
    auto t = fixtures::weatherTable();
    EXPECT_THROW(probability(t, "Humidity", "High"), InvalidInputError);
    EXPECT_THROW(probability(t, "Weather", "Snowy"), InvalidInputError);
}

TEST(ProbabilityTest, EmptyTableIsContractViolation) {
    CategoricalTable t;
    t.addColumn("Weather", {});
    EXPECT_THROW(probability(t, "Weather", "Sunny"), DegenerateProbabilityError);
}
