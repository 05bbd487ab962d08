#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lapjv/routing/suitability.hpp"

using namespace lapjv::routing;

namespace
{

const std::string FAKE_DRIVE = "44 Fake Dr., San Diego, CA 92122";
const std::string OSINSKI_MANORS = "215 Osinski Manors, Lake Kyla, WA 12345";

}  // namespace

TEST(SuitabilityTests, TestStreetName)
{
    EXPECT_EQ(street_name(FAKE_DRIVE), "fake");
    EXPECT_EQ(street_name(OSINSKI_MANORS), "osinski");
    EXPECT_EQ(street_name("215 Osinski Manors"), "osinski");
    EXPECT_EQ(street_name("63187 Volkman Garden Suite 447, Smithport, NE 41526"), "volkmangardensuite");
    EXPECT_EQ(street_name("1797 Adolf Island Apt. 744"), "adolfislandapt");
    EXPECT_EQ(street_name("Broadway"), "");
    EXPECT_EQ(street_name(""), "");
}

TEST(SuitabilityTests, TestLetterCounts)
{
    EXPECT_EQ(count_vowels("Daniel Davidson"), 6);
    EXPECT_EQ(count_consonants("Daniel Davidson"), 8);
    EXPECT_EQ(count_vowels("Sky Lynch"), 0);
    EXPECT_EQ(count_consonants("Sky Lynch"), 8);
    EXPECT_EQ(count_vowels("AEIOU y"), 5);
    EXPECT_EQ(count_consonants("O'Brien-Smith 3rd"), 9);

    EXPECT_EQ(stripped_length("Daniel Davidson"), 14);
    EXPECT_EQ(stripped_length("  Sky\tLynch "), 8);
}

TEST(SuitabilityTests, TestFactors)
{
    EXPECT_EQ(factors(12), (std::vector<int>{2, 3, 4, 6, 12}));
    EXPECT_EQ(factors(7), (std::vector<int>{7}));
    EXPECT_EQ(factors(16), (std::vector<int>{2, 4, 8, 16}));
    EXPECT_TRUE(factors(1).empty());
    EXPECT_TRUE(factors(0).empty());

    EXPECT_TRUE(share_common_factor(4, 14));
    EXPECT_TRUE(share_common_factor(7, 14));
    EXPECT_FALSE(share_common_factor(7, 8));
    EXPECT_FALSE(share_common_factor(1, 1));
    EXPECT_FALSE(share_common_factor(0, 6));
}

TEST(SuitabilityTests, TestSuitabilityScore)
{
    // Even street name, vowels times 1.5, common factor 2
    EXPECT_DOUBLE_EQ(suitability_score("Daniel Davidson", FAKE_DRIVE), 13.5);

    // Odd street name, consonants, common factor 7
    EXPECT_DOUBLE_EQ(suitability_score("Daniel Davidson", OSINSKI_MANORS), 12.0);

    EXPECT_DOUBLE_EQ(suitability_score("Sky Lynch", FAKE_DRIVE), 0.0);
    EXPECT_DOUBLE_EQ(suitability_score("Sky Lynch", OSINSKI_MANORS), 8.0);
}

TEST(SuitabilityTests, TestScoringParameters)
{
    ScoringParameters params{};
    params.even_multiplier = 2.0;
    params.odd_multiplier = 0.5;
    params.common_factor_bonus = 1.0;

    EXPECT_DOUBLE_EQ(suitability_score("Daniel Davidson", FAKE_DRIVE, params), 12.0);
    EXPECT_DOUBLE_EQ(suitability_score("Daniel Davidson", OSINSKI_MANORS, params), 4.0);
}
