/*
 * Utility.cpp
 */

#include "../headers/facetUtil.h"
#include <climits>
#include <stdexcept>

namespace facet
{
    namespace util
    {
        long factorial(long n)
        {
            if (n < 0)
                throw std::invalid_argument("Factorial of a negative number.");

            long result = 1;
            for (long k = 2; k <= n; ++k) {
                if (result > LONG_MAX / k)
                    throw std::overflow_error("Factorial exceeds long range.");
                result *= k;
            }
            return result;
        }

        long gcd(long a, long b)
        {
            if (a < 0 || b < 0)
                throw std::invalid_argument("gcd is defined for non-negative integers only.");
            if (b == 0)
                return a;
            return gcd(b, a % b);
        }

        long min(long a, long b)
        {
            return b < a ? b : a;
        }
    }
}
