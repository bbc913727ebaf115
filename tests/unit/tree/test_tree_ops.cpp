#include <gtest/gtest.h>

#include <string>

#include "mathedit/basic/casting.hpp"
#include "mathedit/syntax/serializer.hpp"
#include "mathedit/test_support/parse_helpers.hpp"
#include "mathedit/tree/expr_context.hpp"
#include "mathedit/tree/tree_ops.hpp"

using mathedit::ExprContext;
using mathedit::Path;
using mathedit::test_support::parse;

TEST(TreeOps, NodeAtFollowsChildIndices)
{
  auto unit = parse("\\frac{a+b}{c}");
  EXPECT_EQ(mathedit::node_at(unit.root, {}), unit.root);
  EXPECT_EQ(mathedit::node_at(unit.root, {1}), unit.root->child(1));
  EXPECT_EQ(mathedit::node_at(unit.root, {0, 2}), unit.root->child(0)->child(2));
  EXPECT_EQ(mathedit::node_at(unit.root, {2}), nullptr);
  EXPECT_EQ(mathedit::node_at(unit.root, {1, 0}), nullptr);
}

TEST(TreeOps, PathHelpers)
{
  EXPECT_EQ(mathedit::to_string(Path{}), "[]");
  EXPECT_EQ(mathedit::to_string(Path{0, 12, 3}), "[0,12,3]");
  EXPECT_TRUE(mathedit::is_prefix({0}, {0, 1}));
  EXPECT_TRUE(mathedit::is_prefix({}, {2}));
  EXPECT_FALSE(mathedit::is_prefix({1}, {0, 1}));
  EXPECT_FALSE(mathedit::is_prefix({0, 1}, {0}));
}

TEST(TreeOps, ReplaceAtCopiesOnlyThePath)
{
  auto unit = parse("\\frac{\\sqrt{x}}{y}");
  ExprContext & ctx = *unit.ctx;
  const auto * z = ctx.create<mathedit::LiteralExpr>(ctx.intern("z"));

  const auto * edited = mathedit::replace_at(ctx, unit.root, {0, 0}, z);
  ASSERT_NE(edited, nullptr);
  EXPECT_NE(edited, unit.root);
  EXPECT_EQ(mathedit::serialize(edited), "\\frac{\\sqrt{z}}{y}");

  // Off-path subtree is shared, the original is untouched
  EXPECT_EQ(edited->child(1), unit.root->child(1));
  EXPECT_EQ(mathedit::serialize(unit.root), "\\frac{\\sqrt{x}}{y}");

  EXPECT_EQ(mathedit::replace_at(ctx, unit.root, {3}, z), nullptr);
  EXPECT_EQ(mathedit::replace_at(ctx, unit.root, {}, z), z);
}

TEST(TreeOps, CloneIntoAnotherArena)
{
  auto unit = parse("\\textcolor{red}{\\begin{array}{c} a \\\\ b \\end{array}}");
  ExprContext other;
  const auto * copy = mathedit::clone_into(other, unit.root);

  ASSERT_NE(copy, nullptr);
  EXPECT_NE(copy, unit.root);
  EXPECT_TRUE(mathedit::structurally_equal(copy, unit.root));

  const auto * wrapper = mathedit::cast<mathedit::FormatWrapperExpr>(copy);
  ASSERT_TRUE(wrapper->attribute.has_value());
  EXPECT_TRUE(other.is_interned(*wrapper->attribute));
}

TEST(TreeOps, CloneMemoPreservesSharing)
{
  auto unit = parse("\\frac{a}{b}");
  ExprContext & ctx = *unit.ctx;
  const auto * c = ctx.create<mathedit::LiteralExpr>(ctx.intern("c"));
  const auto * v2 = mathedit::replace_at(ctx, unit.root, {0}, c);

  ExprContext fresh;
  mathedit::CloneMemo memo;
  const auto * a1 = mathedit::clone_into(fresh, unit.root, memo);
  const auto * a2 = mathedit::clone_into(fresh, v2, memo);
  EXPECT_EQ(a1->child(1), a2->child(1));
  EXPECT_NE(a1->child(0), a2->child(0));
}

TEST(TreeOps, StructuralEqualityIgnoresRanges)
{
  auto a = parse("x^{2}");
  auto b = parse("x ^ 2");
  auto c = parse("x^3");
  EXPECT_TRUE(mathedit::structurally_equal(a.root, b.root));
  EXPECT_FALSE(mathedit::structurally_equal(a.root, c.root));
  EXPECT_FALSE(mathedit::structurally_equal(parse("\\frac{a}{b}").root, parse("\\dfrac{a}{b}").root));
}

TEST(TreeOps, StructuralDepth)
{
  EXPECT_EQ(mathedit::structural_depth(parse("x").root), 0U);
  EXPECT_EQ(mathedit::structural_depth(parse("a+b").root), 0U);
  EXPECT_EQ(mathedit::structural_depth(parse("\\frac{a}{b}").root), 1U);
  EXPECT_EQ(mathedit::structural_depth(parse("\\frac{\\sqrt{x}}{b}").root), 2U);
  // Sequences do not add a level
  EXPECT_EQ(mathedit::structural_depth(parse("a + \\frac{a + \\sqrt{b}}{c}").root), 2U);
  EXPECT_EQ(mathedit::structural_depth(nullptr), 0U);
}

TEST(TreeOps, CountsAndMatrixExtent)
{
  auto unit = parse("\\frac{a}{b}");
  EXPECT_EQ(mathedit::count_nodes(unit.root), 3U);

  auto nested = parse(
    "\\begin{pmatrix} 1 & 2 & 3 \\end{pmatrix} + "
    "\\begin{pmatrix} 1 \\\\ 2 \\\\ 3 \\\\ 4 \\end{pmatrix}");
  const auto ext = mathedit::max_matrix_extent(nested.root);
  EXPECT_EQ(ext.rows, 4U);
  EXPECT_EQ(ext.cols, 3U);

  EXPECT_EQ(mathedit::max_matrix_extent(parse("x").root).rows, 0U);
}

TEST(TreeOps, RebuildKeepsPayload)
{
  auto unit = parse("\\sum_{i}^{n} x");
  ExprContext & ctx = *unit.ctx;
  const auto * y = ctx.create<mathedit::LiteralExpr>(ctx.intern("y"));
  const auto * rebuilt = mathedit::rebuild(
    ctx, unit.root, ctx.list({unit.root->child(0), unit.root->child(1), y}));
  const auto * sum = mathedit::cast<mathedit::SumExpr>(rebuilt);
  EXPECT_TRUE(sum->has_lower);
  EXPECT_TRUE(sum->has_upper);
  EXPECT_EQ(mathedit::serialize(sum), "\\sum_{i}^{n}{y}");
}
