#include <gtest/gtest.h>
#include "visitors/expression_printer.hpp"
#include "sylva_test.hpp"

using namespace sylva;

TEST(ExpressionPrinterTest, SampleExpression)
{
    ASSERT_EQ(printExpression(sampleExpression()), "2 + ((5.0 * -3) / 10.0)");
}

TEST(ExpressionPrinterTest, Literals)
{
    ASSERT_EQ(printExpression(Integer(42)), "42");
    ASSERT_EQ(printExpression(Integer(-7)), "-7");
    ASSERT_EQ(printExpression(Float(5.0)), "5.0");
    ASSERT_EQ(printExpression(Float(0.5)), "0.5");
}

TEST(ExpressionPrinterTest, LargeAndSmallFloatsKeepTheDecimalPoint)
{
    ASSERT_EQ(printExpression(Float(100000.0)), "100000.0");
    ASSERT_EQ(printExpression(Float(0.0001)), "0.0001");
    ASSERT_EQ(printExpression(Add(Integer(1), Float(1e5))), "1 + 100000.0");
}

TEST(ExpressionPrinterTest, RootIsNeverWrapped)
{
    ASSERT_EQ(printExpression(Add(Integer(1), Integer(2))), "1 + 2");
    ASSERT_EQ(printExpression(Subtract(Integer(4), Integer(1))), "4 - 1");
    ASSERT_EQ(printExpression(Multiply(Integer(2), Float(1.5))), "2 * 1.5");
    ASSERT_EQ(printExpression(Divide(Integer(5), Integer(0))), "5 / 0");
}

TEST(ExpressionPrinterTest, BinaryOperandsAreWrapped)
{
    ASSERT_EQ(printExpression(Add(Multiply(Integer(1), Integer(2)), Integer(3))), "(1 * 2) + 3");
    ASSERT_EQ(printExpression(Subtract(Integer(1), Subtract(Integer(2), Integer(3)))), "1 - (2 - 3)");
}

TEST(ExpressionPrinterTest, Negative)
{
    ASSERT_EQ(printExpression(Negative(Integer(3))), "-3");
    ASSERT_EQ(printExpression(Negative(Negative(Integer(3)))), "--3");
    ASSERT_EQ(printExpression(Negative(Add(Integer(2), Integer(3)))), "-(2 + 3)");
    ASSERT_EQ(printExpression(Multiply(Negative(Integer(2)), Integer(4))), "-2 * 4");
}
