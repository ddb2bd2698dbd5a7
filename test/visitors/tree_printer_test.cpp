#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "visitors/tree_printer.hpp"
#include "sylva_test.hpp"

using namespace sylva;

namespace
{
    size_t lineCount(const std::string &text)
    {
        return static_cast<size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
    }
} // namespace

TEST(TreePrinterTest, SceneDiagram)
{
    const std::string expected =
        " ╿ Scene\n"
        " ├─┮ Robot\n"
        " │ ├─┮ Flange\n"
        " │ │ └─┮ Gripper\n"
        " │ │   └─╼ Object\n"
        " │ └─╼ Camera\n"
        " └─┮ Table\n"
        "   └─╼ Box";

    ASSERT_EQ(printTree(sampleTree()), expected);
}

TEST(TreePrinterTest, RootLeaf)
{
    ASSERT_EQ(printTree(Leaf("Box")), " ╿ Box");
}

TEST(TreePrinterTest, OneLinePerElement)
{
    ASSERT_EQ(lineCount(printTree(sampleTree())), 8);
    ASSERT_EQ(lineCount(printTree(Node("A", Leaf("B"), Leaf("C")))), 3);

    std::string output = printTree(sampleTree());
    ASSERT_NE(output.back(), '\n');
}

TEST(TreePrinterTest, LastChildUsesClosingConnector)
{
    ASSERT_EQ(printTree(Node("A", Leaf("B"), Node("C", Leaf("D")))),
              " ╿ A\n"
              " ├─╼ B\n"
              " └─┮ C\n"
              "   └─╼ D");
}

TEST(TreePrinterTest, IndentStyle)
{
    const std::string expected =
        "Scene\n"
        "  Robot\n"
        "    Flange\n"
        "      Gripper\n"
        "        Object\n"
        "    Camera\n"
        "  Table\n"
        "    Box";

    ASSERT_EQ(printTree(sampleTree(), NodeStyle::Indent), expected);
}

TEST(TreePrinterTest, BulletStyle)
{
    ASSERT_EQ(TreePrinter(NodeStyle::Bullet).print(Node("Table", Leaf("Box"), Leaf("Lamp"))),
              "* Table\n"
              "  * Box\n"
              "  * Lamp");
}

TEST(TreePrinterTest, ExpressionOutline)
{
    const std::string expected =
        " ╿ Add\n"
        " ├─╼ Integer(2)\n"
        " └─┮ Divide\n"
        "   ├─┮ Multiply\n"
        "   │ ├─╼ Float(5.0)\n"
        "   │ └─┮ Negative\n"
        "   │   └─╼ Integer(3)\n"
        "   └─╼ Float(10.0)";

    ASSERT_EQ(printTree(sampleExpression()), expected);
}

TEST(TreePrinterTest, ExpressionBulletOutline)
{
    const std::string expected =
        "* Add\n"
        "  * Integer(2)\n"
        "  * Divide\n"
        "    * Multiply\n"
        "      * Float(5.0)\n"
        "      * Negative\n"
        "        * Integer(3)\n"
        "    * Float(10.0)";

    ASSERT_EQ(printTree(sampleExpression(), NodeStyle::Bullet), expected);
    ASSERT_EQ(printTree(Subtract(Integer(1), Integer(2)), NodeStyle::Indent), "Subtract\n  Integer(1)\n  Integer(2)");
}

TEST(TreePrinterTest, StyleNames)
{
    ASSERT_EQ(parseNodeStyle("tree"), NodeStyle::Tree);
    ASSERT_EQ(parseNodeStyle("indent"), NodeStyle::Indent);
    ASSERT_EQ(parseNodeStyle("bullet"), NodeStyle::Bullet);
    ASSERT_FALSE(parseNodeStyle("fancy").has_value());

    for (NodeStyle style : {NodeStyle::Tree, NodeStyle::Indent, NodeStyle::Bullet})
    {
        ASSERT_EQ(parseNodeStyle(formatNodeStyle(style)), style);
    }
}
