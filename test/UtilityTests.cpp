#include <gtest/gtest.h>
#include "../headers/facetUtil.h"
#include <list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace facet;

TEST(UtilityTest, Factorial) {
    ASSERT_EQ(util::factorial(0), 1);
    ASSERT_EQ(util::factorial(1), 1);
    ASSERT_EQ(util::factorial(5), 120);
    ASSERT_EQ(util::factorial(20), 2432902008176640000L);
    ASSERT_THROW(util::factorial(-1), std::invalid_argument);
    ASSERT_THROW(util::factorial(21), std::overflow_error);
}

TEST(UtilityTest, GreatestCommonDivisor) {
    ASSERT_EQ(util::gcd(48, 18), 6);
    ASSERT_EQ(util::gcd(18, 48), 6);
    ASSERT_EQ(util::gcd(7, 0), 7);
    ASSERT_EQ(util::gcd(0, 7), 7);
    ASSERT_EQ(util::gcd(0, 0), 0);
    ASSERT_EQ(util::gcd(17, 5), 1);
    ASSERT_THROW(util::gcd(-4, 2), std::invalid_argument);
}

TEST(UtilityTest, Min) {
    ASSERT_EQ(util::min(3, 9), 3);
    ASSERT_EQ(util::min(9, 3), 3);
    ASSERT_EQ(util::min(-2, -2), -2);
}

TEST(UtilityTest, InsertionSort) {
    std::vector<int> items{3, 1, 2};
    util::insertionSort(items);
    ASSERT_EQ(items, (std::vector<int>{1, 2, 3}));

    std::vector<int> empty;
    util::insertionSort(empty);
    ASSERT_TRUE(empty.empty());

    std::vector<int> descending{5, 4, 3, 2, 1};
    util::insertionSort(descending, [](int a, int b) { return a > b; });
    ASSERT_EQ(descending, (std::vector<int>{5, 4, 3, 2, 1}));
}

TEST(UtilityTest, InsertionSortIsStable) {
    typedef std::pair<int, std::string> Keyed;
    std::vector<Keyed> items{{2, "a"}, {1, "b"}, {2, "c"}, {1, "d"}, {0, "e"}};
    util::insertionSort(items, [](const Keyed& l, const Keyed& r) { return l.first < r.first; });

    std::vector<Keyed> expected{{0, "e"}, {1, "b"}, {1, "d"}, {2, "a"}, {2, "c"}};
    ASSERT_EQ(items, expected);
}

TEST(UtilityTest, ToList) {
    const std::list<int>* absent = nullptr;
    ASSERT_FALSE(util::toList(absent).has_value());

    const std::list<int> none;
    auto empty = util::toList(&none);
    ASSERT_TRUE(empty.has_value());
    ASSERT_TRUE(empty->empty());

    const std::list<int> some{4, 5, 6};
    auto list = util::toList(&some);
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(*list, (std::vector<int>{4, 5, 6}));
}

TEST(UtilityTest, SortedFindIndex) {
    const std::vector<int> sorted{1, 3, 3, 3, 7, 9};
    ASSERT_EQ(util::sortedFindIndex(sorted, 1), std::optional<size_t>(0));
    ASSERT_EQ(util::sortedFindIndex(sorted, 3), std::optional<size_t>(1));
    ASSERT_EQ(util::sortedFindIndex(sorted, 9), std::optional<size_t>(5));
    ASSERT_FALSE(util::sortedFindIndex(sorted, 4).has_value());
    ASSERT_FALSE(util::sortedFindIndex(sorted, 10).has_value());
    ASSERT_FALSE(util::sortedFindIndex(std::vector<int>{}, 1).has_value());
}
