#ifndef LAPJV_ROUTING_SUITABILITY_HPP
#define LAPJV_ROUTING_SUITABILITY_HPP

#include <string>
#include <vector>

namespace lapjv::routing
{

struct ScoringParameters
{
    static constexpr double DEFAULT_EVEN_MULTIPLIER = 1.5;
    static constexpr double DEFAULT_ODD_MULTIPLIER = 1.0;
    static constexpr double DEFAULT_COMMON_FACTOR_BONUS = 1.5;
    static constexpr double DEFAULT_UNSUITABLE_COST = 1.0;

    double even_multiplier{DEFAULT_EVEN_MULTIPLIER};
    double odd_multiplier{DEFAULT_ODD_MULTIPLIER};
    double common_factor_bonus{DEFAULT_COMMON_FACTOR_BONUS};

    // Cost of a pair with zero suitability, and of the padding that makes the cost matrix square
    double unsuitable_cost{DEFAULT_UNSUITABLE_COST};
};

// Street name of a comma separated address line, lower case, without house number, suffix or whitespace
std::string street_name(const std::string& address);

int count_vowels(const std::string& text);
int count_consonants(const std::string& text);

// Number of characters that are not whitespace
int stripped_length(const std::string& text);

// All factors of n except 1
std::vector<int> factors(const int n);
bool share_common_factor(const int lhs, const int rhs);

/**
 * Suitability score (SS) of a driver for a shipment destination.
 *
 * If the length of the destination street name is even, the base SS is the number of vowels in the driver's name
 * times even_multiplier, otherwise the number of consonants times odd_multiplier. If the street name length and the
 * driver name length share a common factor besides 1, the base SS is multiplied by common_factor_bonus.
 */
double suitability_score(const std::string& driver, const std::string& address,
                         const ScoringParameters& params = ScoringParameters{});

}  // namespace lapjv::routing

#endif  // LAPJV_ROUTING_SUITABILITY_HPP
