#include "lapjv/routing/suitability.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace lapjv::routing
{

namespace
{

constexpr auto VOWELS = "aeiou";
constexpr auto CONSONANTS = "bcdfghjklmnpqrstvwxyz";

bool is_space(const char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

int count_letters_in(const std::string& text, const std::string& letters)
{
    return static_cast<int>(std::count_if(text.begin(), text.end(), [&letters](const char c) {
        return letters.find(static_cast<char>(std::tolower(static_cast<unsigned char>(c)))) != std::string::npos;
    }));
}

}  // namespace

std::string street_name(const std::string& address)
{
    static const std::regex word{R"(\w+)"};

    const auto street_line = address.substr(0, address.find(','));

    // Skip the word starting the line (house number) and the words of the last token (suffix such as "Dr.")
    std::string name{};
    for (auto it = std::sregex_iterator(street_line.begin(), street_line.end(), word); it != std::sregex_iterator();
         ++it) {
        const auto begin = it->position();
        const auto end = begin + it->length();
        const bool in_last_token = std::none_of(street_line.begin() + end, street_line.end(), is_space);
        if (begin == 0 || in_last_token) {
            continue;
        }
        name += it->str();
    }

    std::transform(name.begin(), name.end(), name.begin(),
                   [](const char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return name;
}

int count_vowels(const std::string& text)
{
    return count_letters_in(text, VOWELS);
}

int count_consonants(const std::string& text)
{
    return count_letters_in(text, CONSONANTS);
}

int stripped_length(const std::string& text)
{
    return static_cast<int>(std::count_if(text.begin(), text.end(), [](const char c) { return !is_space(c); }));
}

std::vector<int> factors(const int n)
{
    // Divisor pairs (i, n / i) only need i up to sqrt(n)
    std::set<int> result;
    for (int i = 1; i * i <= n; i++) {
        if (n % i == 0) {
            result.insert(i);
            result.insert(n / i);
        }
    }
    result.erase(1);
    return std::vector<int>(result.begin(), result.end());
}

bool share_common_factor(const int lhs, const int rhs)
{
    const auto lhs_factors = factors(lhs);
    const auto rhs_factors = factors(rhs);
    return std::any_of(lhs_factors.begin(), lhs_factors.end(), [&rhs_factors](const int f) {
        return std::binary_search(rhs_factors.begin(), rhs_factors.end(), f);
    });
}

double suitability_score(const std::string& driver, const std::string& address, const ScoringParameters& params)
{
    const auto street_length = static_cast<int>(street_name(address).size());

    const double base = street_length % 2 == 0 ? count_vowels(driver) * params.even_multiplier
                                               : count_consonants(driver) * params.odd_multiplier;

    if (share_common_factor(street_length, stripped_length(driver))) {
        return base * params.common_factor_bonus;
    }
    return base;
}

}  // namespace lapjv::routing
