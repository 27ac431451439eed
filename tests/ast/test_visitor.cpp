/**
 * @file test_visitor.cpp
 * @brief Worklist traversal, slot replacement and fixed-point rewriting
 */

#include "pkgaudit/ast/visitor.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace pkgaudit::ast::test {

namespace {

NodePtr num(std::int64_t value)
{
    return make_node(Number{value});
}

NodePtr str(std::string value)
{
    return make_node(String{std::move(value)});
}

/// Rule built from a kind predicate and a callback
class LambdaRule final : public NodeRule
{
public:
    LambdaRule(std::function<bool(NodeKind)> handles, std::function<void(Context&)> visit)
        : m_handles(std::move(handles))
        , m_visit(std::move(visit))
    {}

    [[nodiscard]] std::string_view name() const override { return "lambda"; }
    [[nodiscard]] bool handles(NodeKind kind) const override { return m_handles(kind); }
    void visit(Context& context) override { m_visit(context); }

private:
    std::function<bool(NodeKind)> m_handles;
    std::function<void(Context&)> m_visit;
};

RulePtr every_node(std::function<void(Context&)> visit)
{
    return std::make_shared<LambdaRule>([](NodeKind) { return true; }, std::move(visit));
}

RulePtr on_kind(NodeKind kind, std::function<void(Context&)> visit)
{
    return std::make_shared<LambdaRule>([kind](NodeKind k) { return k == kind; }, std::move(visit));
}

Finding finding_for(const Context& context, std::string signature)
{
    return Finding(Finding::Fields{.type = "Test",
                                   .location = context.location().string(),
                                   .signature = std::move(signature)});
}

/// Module[ Call(f, args=[1, "x"]), 2 ]
NodePtr sample_tree()
{
    auto call = make_node(Call{.func = make_node(Variable{.name = "f", .kind = "name"}),
                               .args = {num(1), str("x")}});
    return make_node(Module{.body = {call, num(2)}});
}

TEST(TraversalTest, BreadthFirstOrder)
{
    std::vector<std::string> visited;
    std::vector<int> depths;
    Traversal traversal(sample_tree(),
                        "setup.py",
                        {every_node([&](Context& context) {
                            visited.emplace_back(to_string(context.node()->kind()));
                            depths.push_back(context.depth());
                        })},
                        64);
    traversal.run();

    EXPECT_EQ(visited,
              (std::vector<std::string>{"Module", "Call", "Number", "Number", "String", "Var"}));
    EXPECT_EQ(depths, (std::vector<int>{0, 1, 1, 2, 2, 2}));
    EXPECT_TRUE(traversal.finished());
    EXPECT_FALSE(traversal.modified());
}

TEST(TraversalTest, ContextExposesParentAndField)
{
    std::vector<std::string> fields;
    bool parent_is_call = false;
    Traversal traversal(sample_tree(),
                        "setup.py",
                        {on_kind(NodeKind::kString,
                                 [&](Context& context) {
                                     fields.push_back(context.field());
                                     parent_is_call = context.parent()
                                                      && context.parent()->node()->kind()
                                                             == NodeKind::kCall;
                                     EXPECT_EQ(context.location().string(), "setup.py");
                                 })},
                        64);
    traversal.run();
    EXPECT_EQ(fields, (std::vector<std::string>{"args[1]"}));
    EXPECT_TRUE(parent_is_call);
}

TEST(TraversalTest, DispatchesOnlyMatchingKinds)
{
    int calls = 0;
    int numbers = 0;
    Traversal traversal(sample_tree(),
                        "setup.py",
                        {on_kind(NodeKind::kCall, [&](Context&) { ++calls; }),
                         on_kind(NodeKind::kNumber, [&](Context&) { ++numbers; })},
                        64);
    traversal.run();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(numbers, 2);
}

TEST(TraversalTest, ReplacementIsWrittenToTheParentSlot)
{
    auto root = sample_tree();
    std::vector<std::string> visited;
    Traversal traversal(root,
                        "setup.py",
                        {on_kind(NodeKind::kCall,
                                 [](Context& context) { context.replace(str("folded")); }),
                         every_node([&](Context& context) {
                             visited.emplace_back(to_string(context.node()->kind()));
                         })},
                        64);
    traversal.run();

    EXPECT_TRUE(traversal.modified());
    const auto& body = root->as<Module>()->body;
    ASSERT_NE(body[0]->as<String>(), nullptr);
    EXPECT_EQ(body[0]->as<String>()->value, "folded");
    // Children of the replaced call are never queued
    EXPECT_EQ(visited, (std::vector<std::string>{"Module", "String", "Number"}));
}

TEST(TraversalTest, RootReplacement)
{
    Traversal traversal(num(1),
                        "setup.py",
                        {on_kind(NodeKind::kNumber, [](Context& context) {
                            if (context.depth() == 0) {
                                context.replace(make_node(Module{}));
                            }
                        })},
                        64);
    traversal.run();
    EXPECT_EQ(traversal.root()->kind(), NodeKind::kModule);
    EXPECT_TRUE(traversal.modified());
}

TEST(TraversalTest, DepthLimitStopsDescent)
{
    NodePtr tree = num(0);
    for (int i = 0; i < 10; ++i) {
        tree = make_node(Module{.body = {tree}});
    }
    int visited = 0;
    Traversal traversal(tree, "deep.py", {every_node([&](Context&) { ++visited; })}, 3);
    traversal.run();
    EXPECT_EQ(visited, 4);
}

TEST(TraversalTest, FindingsAreProducedLazily)
{
    int visits = 0;
    Traversal traversal(sample_tree(),
                        "setup.py",
                        {every_node([&](Context& context) {
                            ++visits;
                            if (context.node()->kind() == NodeKind::kNumber) {
                                context.report(finding_for(context, "n" + std::to_string(visits)));
                            }
                        })},
                        64);

    auto first = traversal.next_finding();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->signature(), "n3");
    EXPECT_FALSE(traversal.finished());

    auto second = traversal.next_finding();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->signature(), "n4");
    EXPECT_FALSE(traversal.next_finding().has_value());
    EXPECT_EQ(visits, 6);
}

TEST(RewriteTest, RunsUntilNoReplacement)
{
    // Each pass decrements the literals that are still positive
    auto rule = on_kind(NodeKind::kNumber, [](Context& context) {
        const auto value = context.node()->as<Number>()->value;
        if (value > 0) {
            context.replace(num(value - 1));
        }
    });
    auto root = make_node(Module{.body = {num(2), num(1)}});
    auto result = run_to_fixed_point(root, "setup.py", {rule}, 64, 8);

    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.passes, 3);
    const auto& body = result.root->as<Module>()->body;
    EXPECT_EQ(body[0]->as<Number>()->value, 0);
    EXPECT_EQ(body[1]->as<Number>()->value, 0);
}

TEST(RewriteTest, StopsAtPassLimit)
{
    auto rule = on_kind(NodeKind::kNumber, [](Context& context) {
        context.replace(num(context.node()->as<Number>()->value + 1));
    });
    auto result = run_to_fixed_point(make_node(Module{.body = {num(0)}}), "setup.py", {rule}, 64, 4);
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.passes, 4);
    EXPECT_EQ(result.root->as<Module>()->body[0]->as<Number>()->value, 4);
}

TEST(RewriteTest, UnchangedTreeConvergesInOnePass)
{
    auto result = run_to_fixed_point(sample_tree(), "setup.py", {}, 64, 8);
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.passes, 1);
    EXPECT_TRUE(result.findings.empty());
}

}  // namespace

}  // namespace pkgaudit::ast::test
