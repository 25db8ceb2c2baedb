/*
 * Fraction.cpp
 *
 *  Normalized rational numbers.
 */

#include "../headers/facet_internal.h"
#include "../headers/facetUtil.h"
#include <climits>

namespace facet
{
    namespace {
        [[noreturn]] void reportOverflow(const char* operation)
        {
            throw ArithmeticError(Message::colon(Message::OperationImpossible) + operation + " overflows long");
        }

        // LONG_MIN has no positive counterpart and is never a valid term.
        long checkTerm(long value, const char* operation)
        {
            if (value == LONG_MIN)
                reportOverflow(operation);
            return value;
        }

        long multiplyTerms(long a, long b, const char* operation)
        {
            long result;
            if (__builtin_mul_overflow(a, b, &result))
                reportOverflow(operation);
            return checkTerm(result, operation);
        }

        long addTerms(long a, long b, const char* operation)
        {
            long result;
            if (__builtin_add_overflow(a, b, &result))
                reportOverflow(operation);
            return checkTerm(result, operation);
        }

        long magnitude(long value)
        {
            return value < 0 ? -value : value;
        }

        //! n1/d1 + n2/d2 over the least common denominator. d1, d2 > 0.
        void sumTerms(long n1, long d1, long n2, long d2, const char* operation, long& n, long& d)
        {
            const long divisor = util::gcd(d1, d2);
            const long scale1 = d2 / divisor;
            const long scale2 = d1 / divisor;
            n = addTerms(multiplyTerms(n1, scale1, operation), multiplyTerms(n2, scale2, operation), operation);
            d = multiplyTerms(d1, scale1, operation);
        }

        //! n1/d1 * n2/d2, cross-reduced before multiplying. d1, d2 > 0.
        void productTerms(long n1, long d1, long n2, long d2, const char* operation, long& n, long& d)
        {
            const long g1 = util::gcd(magnitude(n1), d2);
            const long g2 = util::gcd(magnitude(n2), d1);
            n = multiplyTerms(n1 / g1, n2 / g2, operation);
            d = multiplyTerms(d1 / g2, d2 / g1, operation);
        }

        /**
         * Order of a/b against c/d for a, c >= 0 and b, d > 0.
         * Compares integer parts, then the reciprocals of the remainders, so no
         * product is ever formed.
         */
        int compareMagnitudes(long a, long b, long c, long d)
        {
            int sign = 1;
            while (true) {
                const long q1 = a / b;
                const long q2 = c / d;
                if (q1 != q2)
                    return q1 < q2 ? -sign : sign;

                const long r1 = a % b;
                const long r2 = c % d;
                if (r1 == 0 || r2 == 0) {
                    if (r1 == r2)
                        return 0;
                    return r1 == 0 ? -sign : sign;
                }

                a = b; b = r1;
                c = d; d = r2;
                sign = -sign;
            }
        }
    }

    Fraction::Fraction(long numerator, long denominator) :
        numerator(numerator), denominator(denominator)
    {
        if (denominator == 0)
            throw std::invalid_argument(Message::ZeroDenominator);
        checkTerm(numerator, "construct");
        checkTerm(denominator, "construct");
        simplify();
    }

    void Fraction::simplify()
    {
        if (denominator < 0) {
            numerator = -numerator;
            denominator = -denominator;
        }

        if (numerator == 0) {
            denominator = 1;
            return;
        }

        const long divisor = util::gcd(magnitude(numerator), denominator);
        numerator /= divisor;
        denominator /= divisor;
    }

    //- In place
    // Results are computed in full before any term is assigned, so a failed
    // operation leaves the fraction unchanged.

    void Fraction::add(const Fraction& other)
    {
        long n, d;
        sumTerms(numerator, denominator, other.numerator, other.denominator, "add", n, d);
        numerator = n;
        denominator = d;
        simplify();
    }

    void Fraction::subtract(const Fraction& other)
    {
        long n, d;
        sumTerms(numerator, denominator, -other.numerator, other.denominator, "subtract", n, d);
        numerator = n;
        denominator = d;
        simplify();
    }

    void Fraction::multiply(const Fraction& other)
    {
        long n, d;
        productTerms(numerator, denominator, other.numerator, other.denominator, "multiply", n, d);
        numerator = n;
        denominator = d;
        simplify();
    }

    void Fraction::divide(const Fraction& other)
    {
        if (other.numerator == 0)
            throw ArithmeticError(Message::DivisionByZero);

        long reciprocalNumerator = other.denominator;
        long reciprocalDenominator = other.numerator;
        if (reciprocalDenominator < 0) {
            reciprocalNumerator = -reciprocalNumerator;
            reciprocalDenominator = -reciprocalDenominator;
        }

        long n, d;
        productTerms(numerator, denominator, reciprocalNumerator, reciprocalDenominator, "divide", n, d);
        numerator = n;
        denominator = d;
        simplify();
    }

    void Fraction::invert()
    {
        if (numerator == 0)
            throw ArithmeticError(Message::ZeroNumerator);

        const long n = numerator;
        numerator = denominator;
        denominator = n;
        simplify();
    }

    //- Comparison

    int Fraction::compare(const Fraction& other) const
    {
        const bool negative = numerator < 0;
        if (negative != (other.numerator < 0))
            return negative ? -1 : 1;

        const int order = compareMagnitudes(magnitude(numerator), denominator,
                                            magnitude(other.numerator), other.denominator);
        return negative ? -order : order;
    }

    bool Fraction::operator==(const Fraction& other) const
    {
        return numerator == other.numerator && denominator == other.denominator;
    }

    //- Conversion

    double Fraction::doubleValue() const
    {
        return static_cast<double>(numerator) / static_cast<double>(denominator);
    }

    long Fraction::longValue() const
    {
        return numerator / denominator;
    }

    std::string Fraction::toString() const
    {
        return denominator > 1 ? toStringWithDenominator() : std::to_string(numerator);
    }

    std::string Fraction::toStringWithDenominator() const
    {
        return std::to_string(numerator) + "/" + std::to_string(denominator);
    }
}
