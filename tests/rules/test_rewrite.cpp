/**
 * @file test_rewrite.cpp
 * @brief Import resolution and constant folding
 */

#include "pkgaudit/rules/rewrite.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace pkgaudit::rules::test {

namespace {

using ast::make_node;
using ast::NodePtr;

NodePtr num(std::int64_t value)
{
    return make_node(ast::Number{value});
}

NodePtr str(std::string value)
{
    return make_node(ast::String{std::move(value)});
}

NodePtr binop(std::string op, NodePtr left, NodePtr right)
{
    return make_node(
        ast::BinaryOp{.op = std::move(op), .left = std::move(left), .right = std::move(right)}, 5);
}

/// Rewrite a single expression statement and return the resulting expression
NodePtr rewrite(NodePtr expression)
{
    auto result = ast::run_to_fixed_point(make_node(ast::Module{.body = {std::move(expression)}}),
                                          "setup.py",
                                          make_rewrite_rules(),
                                          64,
                                          8);
    EXPECT_TRUE(result.converged);
    return result.root->as<ast::Module>()->body.front();
}

TEST(ConstantFoldingTest, Strings)
{
    auto joined = rewrite(binop("Add", str("ev"), str("al")));
    ASSERT_NE(joined->as<ast::String>(), nullptr);
    EXPECT_EQ(joined->as<ast::String>()->value, "eval");
    EXPECT_EQ(joined->line_no(), 5);

    EXPECT_EQ(rewrite(binop("Mult", str("ab"), num(3)))->as<ast::String>()->value, "ababab");
    EXPECT_EQ(rewrite(binop("Mult", num(2), str("x")))->as<ast::String>()->value, "xx");
    EXPECT_EQ(rewrite(binop("Mult", str("x"), num(-1)))->as<ast::String>()->value, "");
}

TEST(ConstantFoldingTest, Numbers)
{
    EXPECT_EQ(rewrite(binop("Add", num(2), num(3)))->as<ast::Number>()->value, 5);
    EXPECT_EQ(rewrite(binop("Sub", num(5), num(7)))->as<ast::Number>()->value, -2);
    EXPECT_EQ(rewrite(binop("Mult", num(1024), num(2)))->as<ast::Number>()->value, 2048);
}

TEST(ConstantFoldingTest, NestedExpressionsFoldOverPasses)
{
    auto folded = rewrite(binop("Add", binop("Add", str("__im"), str("port")), str("__")));
    ASSERT_NE(folded->as<ast::String>(), nullptr);
    EXPECT_EQ(folded->as<ast::String>()->value, "__import__");
}

TEST(ConstantFoldingTest, UnsupportedOperationsAreKept)
{
    EXPECT_EQ(rewrite(binop("Div", num(4), num(2)))->kind(), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(rewrite(binop("Add", str("a"), num(1)))->kind(), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(rewrite(binop("Sub", str("a"), str("b")))->kind(), ast::NodeKind::kBinaryOp);
    const auto max = std::numeric_limits<std::int64_t>::max();
    EXPECT_EQ(rewrite(binop("Add", num(max), num(1)))->kind(), ast::NodeKind::kBinaryOp);
}

TEST(ConstantFoldingTest, ArithmeticAtTheIntegerLimits)
{
    const auto max = std::numeric_limits<std::int64_t>::max();
    const auto min = std::numeric_limits<std::int64_t>::min();
    const auto kind = [](const NodePtr& node) { return node->kind(); };

    EXPECT_EQ(kind(rewrite(binop("Sub", num(min), num(1)))), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(kind(rewrite(binop("Add", num(min), num(-1)))), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(kind(rewrite(binop("Sub", num(0), num(min)))), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(kind(rewrite(binop("Mult", num(max / 2 + 1), num(2)))), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(kind(rewrite(binop("Mult", num(-1), num(min)))), ast::NodeKind::kBinaryOp);
    EXPECT_EQ(kind(rewrite(binop("Mult", num(min), num(-1)))), ast::NodeKind::kBinaryOp);

    EXPECT_EQ(rewrite(binop("Add", num(max), num(-1)))->as<ast::Number>()->value, max - 1);
    EXPECT_EQ(rewrite(binop("Sub", num(min), num(-1)))->as<ast::Number>()->value, min + 1);
    EXPECT_EQ(rewrite(binop("Mult", num(max / 2), num(2)))->as<ast::Number>()->value, max - 1);
    EXPECT_EQ(rewrite(binop("Mult", num(-3), num(-4)))->as<ast::Number>()->value, 12);
    EXPECT_EQ(rewrite(binop("Mult", num(0), num(min)))->as<ast::Number>()->value, 0);
}

TEST(ConstantFoldingTest, OversizedResultsAreKept)
{
    EXPECT_EQ(rewrite(binop("Mult", str("abcd"), num(1 << 20)))->kind(), ast::NodeKind::kBinaryOp);
}

TEST(ImportResolverTest, Bindings)
{
    auto resolver = std::make_shared<ImportResolver>();
    auto tree = make_node(ast::Module{.body = {
        make_node(ast::Import{.module = "os.path", .alias = "os.path"}),
        make_node(ast::Import{.module = "subprocess", .alias = "sp"}),
        make_node(ast::Import{.module = "base64.b64decode",
                              .alias = "decode",
                              .form = ast::ImportForm::kFrom}),
    }});
    ast::Traversal traversal(tree, "setup.py", {resolver}, 64);
    traversal.run();

    const auto& bindings = resolver->bindings();
    ASSERT_EQ(bindings.size(), 3U);
    EXPECT_EQ(bindings.at("os").module, "os");
    EXPECT_EQ(bindings.at("sp").module, "subprocess");
    EXPECT_EQ(bindings.at("decode").module, "base64.b64decode");
}

TEST(ImportResolverTest, ReplacesUnboundNames)
{
    auto reference = make_node(ast::Variable{.name = "sp", .kind = "name"}, 3);
    auto attribute = make_node(ast::Attribute{.source = reference, .attr = "Popen"});
    auto tree = make_node(ast::Module{.body = {
        make_node(ast::Import{.module = "subprocess", .alias = "sp"}),
        attribute,
    }});
    auto result = ast::run_to_fixed_point(tree, "setup.py", make_rewrite_rules(), 64, 8);

    EXPECT_TRUE(result.converged);
    const auto& source = attribute->as<ast::Attribute>()->source;
    ASSERT_EQ(source->kind(), ast::NodeKind::kImport);
    EXPECT_EQ(source->line_no(), 3);
    EXPECT_EQ(attribute->full_name(), "subprocess.Popen");
}

TEST(ImportResolverTest, LeavesAssignmentsAndUnknownNames)
{
    auto assigned = make_node(ast::Variable{.name = "sp", .value = num(1), .kind = "assign"});
    auto unknown = make_node(ast::Variable{.name = "other", .kind = "name"});
    auto tree = make_node(ast::Module{.body = {
        make_node(ast::Import{.module = "subprocess", .alias = "sp"}),
        assigned,
        unknown,
    }});
    auto result = ast::run_to_fixed_point(tree, "setup.py", make_rewrite_rules(), 64, 8);

    EXPECT_EQ(result.passes, 1);
    const auto& body = result.root->as<ast::Module>()->body;
    EXPECT_EQ(body[1], assigned);
    EXPECT_EQ(body[2], unknown);
}

}  // namespace

}  // namespace pkgaudit::rules::test
