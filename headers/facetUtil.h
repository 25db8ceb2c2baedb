/*
 * facetUtil.h
 *
 *  Generic numeric and sequence helpers.
 */

#ifndef FACET_UTIL_H_
#define FACET_UTIL_H_

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace facet
{
    namespace util
    {
        //- Numeric
        /**
         * @brief Returns n!, with 0! == 1! == 1.
         * @throws std::invalid_argument if \a n is negative.
         * @throws std::overflow_error if the result does not fit a long.
         */
        long factorial(long n);

        /**
         * @brief Greatest common divisor of two non-negative integers, gcd(a, 0) == a.
         * @throws std::invalid_argument if either number is negative.
         */
        long gcd(long a, long b);

        long min(long a, long b);

        //- Sequences
        /**
         * @brief Sorts \a items in place by insertion. Stable: equal keys keep their order.
         */
        template <typename T, typename Compare = std::less<T>>
        void insertionSort(std::vector<T>& items, Compare compare = Compare())
        {
            for (size_t i = 1; i < items.size(); ++i) {
                T key = std::move(items[i]);
                size_t j = i;
                while (j > 0 && compare(key, items[j - 1])) {
                    items[j] = std::move(items[j - 1]);
                    --j;
                }
                items[j] = std::move(key);
            }
        }

        /**
         * @brief Copies an iterable into a list.
         * An absent source yields no value; an empty source yields an empty list.
         */
        template <typename Iterable>
        std::optional<std::vector<typename Iterable::value_type>> toList(const Iterable* iterable)
        {
            if (iterable == nullptr)
                return std::nullopt;
            return std::vector<typename Iterable::value_type>(std::begin(*iterable), std::end(*iterable));
        }

        /**
         * @brief Index of the first occurrence of \a item in \a sortedItems, by binary search.
         */
        template <typename T, typename Compare = std::less<T>>
        std::optional<size_t> sortedFindIndex(const std::vector<T>& sortedItems, const T& item, Compare compare = Compare())
        {
            size_t low = 0;
            size_t high = sortedItems.size();
            while (low < high) {
                const size_t middle = low + (high - low) / 2;
                if (compare(sortedItems[middle], item))
                    low = middle + 1;
                else
                    high = middle;
            }
            if (low < sortedItems.size() && !compare(item, sortedItems[low]))
                return low;
            return std::nullopt;
        }
    }
}

#endif /* FACET_UTIL_H_ */
