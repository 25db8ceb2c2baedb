#include <gtest/gtest.h>
#include "../headers/facetCore.h"
#include <climits>
#include <stdexcept>

using namespace facet;

TEST(FractionTest, Normalization) {
    Fraction f(6, 8);
    ASSERT_EQ(f.getNumerator(), 3);
    ASSERT_EQ(f.getDenominator(), 4);

    Fraction negative(3, -9);
    ASSERT_EQ(negative.getNumerator(), -1);
    ASSERT_EQ(negative.getDenominator(), 3);

    Fraction zero(0, -5);
    ASSERT_EQ(zero.getNumerator(), 0);
    ASSERT_EQ(zero.getDenominator(), 1);

    ASSERT_THROW(Fraction(1, 0), std::invalid_argument);
}

TEST(FractionTest, Arithmetic) {
    Fraction f(1, 4);
    f.add(Fraction(1, 4));
    ASSERT_EQ(f, Fraction(1, 2));
    f.subtract(Fraction(2, 3));
    ASSERT_EQ(f, Fraction(-1, 6));
    f.multiply(Fraction(-3));
    ASSERT_EQ(f, Fraction(1, 2));
    f.divide(Fraction(1, 4));
    ASSERT_EQ(f, Fraction(2));

    f /= f;
    ASSERT_EQ(f, Fraction(1));
    ASSERT_THROW(f.divide(Fraction(0)), ArithmeticError);
    ASSERT_EQ(f, Fraction(1));
}

TEST(FractionTest, Inversion) {
    Fraction f(-2, 3);
    f.invert();
    ASSERT_EQ(f.getNumerator(), -3);
    ASSERT_EQ(f.getDenominator(), 2);

    Fraction zero(0);
    ASSERT_THROW(zero.invert(), ArithmeticError);
}

TEST(FractionTest, ComparisonAndConversion) {
    ASSERT_LT(Fraction(1, 3).compare(Fraction(1, 2)), 0);
    ASSERT_GT(Fraction(-1, 3).compare(Fraction(-1, 2)), 0);
    ASSERT_EQ(Fraction(2, 4).compare(Fraction(1, 2)), 0);
    ASSERT_TRUE(Fraction(1, 3) < Fraction(1, 2));
    ASSERT_NE(Fraction(1, 3), Fraction(1, 2));

    ASSERT_DOUBLE_EQ(Fraction(3, 4).doubleValue(), 0.75);
    ASSERT_EQ(Fraction(7, 2).longValue(), 3);
    ASSERT_EQ(Fraction(7, 2).toString(), "7/2");
    ASSERT_EQ(Fraction(4, 2).toString(), "2");
    ASSERT_EQ(Fraction(4, 2).toStringWithDenominator(), "2/1");
}

TEST(FractionTest, ExtremeTerms) {
    ASSERT_THROW(Fraction(LONG_MIN), ArithmeticError);
    ASSERT_THROW(Fraction(1, LONG_MIN), ArithmeticError);

    Fraction largest(LONG_MAX);
    Fraction smallest(-LONG_MAX);
    ASSERT_EQ(largest.getNumerator(), LONG_MAX);
    ASSERT_EQ(smallest.getNumerator(), -LONG_MAX);
    ASSERT_THROW(smallest.subtract(Fraction(1)), ArithmeticError);
    ASSERT_EQ(smallest, Fraction(-LONG_MAX));
}

TEST(FractionTest, OverflowLeavesValueUnchanged) {
    const Fraction start(LONG_MAX / 2 + 1, 3);
    Fraction f = start;
    try {
        f.add(Fraction(1, 5));
        FAIL() << "sum does not fit a long";
    } catch (const ArithmeticError& e) {
        ASSERT_STREQ(e.what(), "The operation is impossible: add overflows long");
    }
    ASSERT_EQ(f, start);

    ASSERT_THROW(f.multiply(Fraction(LONG_MAX)), ArithmeticError);
    ASSERT_THROW(f.divide(Fraction(1, 7)), ArithmeticError);
    ASSERT_EQ(f, start);
}

TEST(FractionTest, LargeTermsReduceBeforeMultiplying) {
    Fraction tiny(1, 1L << 40);
    tiny.add(Fraction(1, 1L << 40));
    ASSERT_EQ(tiny, Fraction(1, 1L << 39));

    Fraction f(LONG_MAX, 2);
    f.multiply(Fraction(2, LONG_MAX));
    ASSERT_EQ(f, Fraction(1));

    Fraction g(LONG_MAX, 3);
    g.divide(Fraction(LONG_MAX, 3));
    ASSERT_EQ(g, Fraction(1));
}

TEST(FractionTest, ComparisonOfLargeTerms) {
    ASSERT_GT(Fraction(LONG_MAX, 3).compare(Fraction(LONG_MAX, 5)), 0);
    ASSERT_LT(Fraction(-LONG_MAX, 3).compare(Fraction(-LONG_MAX, 5)), 0);
    ASSERT_GT(Fraction(LONG_MAX - 1, LONG_MAX).compare(Fraction(LONG_MAX - 2, LONG_MAX - 1)), 0);
    ASSERT_EQ(Fraction(LONG_MAX, 7).compare(Fraction(LONG_MAX, 7)), 0);
    ASSERT_LT(Fraction(0).compare(Fraction(1, LONG_MAX)), 0);
}

TEST(FractionTest, FreeOperandOverflowIsReported) {
    FreeValue<Fraction> value(Fraction(LONG_MAX));
    ASSERT_THROW(value.add(Fraction(1)), ArithmeticError);
    ASSERT_EQ(value.getValue(), Fraction(LONG_MAX));
}
