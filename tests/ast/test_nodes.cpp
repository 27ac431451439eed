/**
 * @file test_nodes.cpp
 * @brief Node metadata, child slots and structural taint
 */

#include "pkgaudit/ast/nodes.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace pkgaudit::ast::test {

namespace {

NodePtr name(std::string id)
{
    return make_node(Variable{.name = std::move(id), .kind = "name"});
}

NodePtr str(std::string value)
{
    return make_node(String{std::move(value)});
}

NodePtr num(std::int64_t value)
{
    return make_node(Number{value});
}

TEST(NodeTest, KindFollowsAlternative)
{
    EXPECT_EQ(num(1)->kind(), NodeKind::kNumber);
    EXPECT_EQ(name("x")->kind(), NodeKind::kVariable);
    EXPECT_EQ(to_string(NodeKind::kBinaryOp), "BinOp");
    EXPECT_EQ(to_string(NodeKind::kVariable), "Var");
}

TEST(NodeTest, FullNameOfImportChain)
{
    auto import = make_node(Import{.module = "cryptography.hazmat.primitives.asymmetric.rsa",
                                   .alias = "rsa",
                                   .form = ImportForm::kFrom});
    auto attribute = make_node(Attribute{.source = import, .attr = "generate_private_key"});
    auto call = make_node(Call{.func = attribute});

    EXPECT_EQ(import->full_name(), "cryptography.hazmat.primitives.asymmetric.rsa");
    EXPECT_EQ(attribute->full_name(),
              "cryptography.hazmat.primitives.asymmetric.rsa.generate_private_key");
    EXPECT_EQ(call->full_name(), attribute->full_name());

    auto nested = make_node(Attribute{.source = attribute, .attr = "inner"});
    EXPECT_EQ(nested->full_name(),
              "cryptography.hazmat.primitives.asymmetric.rsa.generate_private_key.inner");
}

TEST(NodeTest, FullNameIsAbsentForUnresolvedSources)
{
    auto attribute = make_node(Attribute{.source = name("rsa"), .attr = "generate_private_key"});
    EXPECT_FALSE(attribute->full_name().has_value());
    EXPECT_FALSE(num(3)->full_name().has_value());

    EXPECT_EQ(name("open")->full_name(), "open");
    auto assigned = make_node(Variable{.name = "x", .value = num(1)});
    EXPECT_FALSE(assigned->full_name().has_value());

    attribute->set_full_name("explicit.name");
    EXPECT_EQ(attribute->full_name(), "explicit.name");
}

TEST(NodeTest, StaticNodes)
{
    EXPECT_TRUE(num(1)->is_static());
    EXPECT_TRUE(str("a")->is_static());
    EXPECT_TRUE(make_node(Dictionary{.keys = {str("k")}, .values = {num(1)}})->is_static());
    EXPECT_FALSE(make_node(Dictionary{.keys = {str("k")}, .values = {name("v")}})->is_static());
    EXPECT_TRUE(make_node(BinaryOp{.op = "Add", .left = num(1), .right = num(2)})->is_static());
    EXPECT_FALSE(make_node(BinaryOp{.op = "Add", .left = num(1), .right = name("x")})->is_static());
    EXPECT_FALSE(name("x")->is_static());
}

TEST(NodeTest, EnumerateSkipsNullSlots)
{
    auto call = make_node(Call{.func = name("f"),
                               .args = {num(1), nullptr, num(3)},
                               .keywords = {Keyword{.name = "bits", .value = num(2048)}}});
    auto slots = enumerate_children(call);

    std::vector<std::string> fields;
    for (const auto& slot : slots) {
        fields.push_back(slot.field);
    }
    EXPECT_EQ(fields, (std::vector<std::string>{"args[0]", "args[2]", "keywords[bits]", "func"}));
    EXPECT_TRUE(enumerate_children(num(1)).empty());
    EXPECT_TRUE(enumerate_children(nullptr).empty());
}

TEST(NodeTest, SlotAssignReplacesExactlyOnePosition)
{
    auto first = num(1);
    auto second = num(2);
    auto list = make_node(Module{.body = {first, second}});
    auto slots = enumerate_children(list);
    ASSERT_EQ(slots.size(), 2U);

    slots[1].assign(str("replaced"));

    const auto& body = list->as<Module>()->body;
    EXPECT_EQ(body[0], first);
    ASSERT_NE(body[1]->as<String>(), nullptr);
    EXPECT_EQ(body[1]->as<String>()->value, "replaced");
}

TEST(NodeTest, AssignKeepsOwnerAlive)
{
    ChildSlot slot;
    std::weak_ptr<Node> weak;
    {
        auto variable = make_node(Variable{.name = "x", .value = num(1)});
        weak = variable;
        slot = enumerate_children(variable).front();
    }
    EXPECT_FALSE(weak.expired());
    slot.assign(num(7));
    EXPECT_EQ(weak.lock()->as<Variable>()->value->as<Number>()->value, 7);
}

TEST(NodeTest, SlotsStayValidAfterOtherAssignments)
{
    auto call = make_node(Call{.func = name("f"),
                               .args = {num(1), num(2)},
                               .keywords = {Keyword{.name = "bits", .value = num(512)}}});
    auto stale = enumerate_children(call);
    ASSERT_EQ(stale.size(), 4U);

    stale[2].assign(num(4096));
    auto fresh = enumerate_children(call);
    fresh[1].assign(str("second"));
    stale[0].assign(num(10));
    stale[0].assign(num(11));

    const auto* data = call->as<Call>();
    ASSERT_EQ(data->args.size(), 2U);
    EXPECT_EQ(data->args[0]->as<Number>()->value, 11);
    EXPECT_EQ(data->args[1]->as<String>()->value, "second");
    ASSERT_EQ(data->keywords.size(), 1U);
    EXPECT_EQ(data->keywords[0].value->as<Number>()->value, 4096);
}

TEST(NodeTest, ComputeTaint)
{
    auto tainted = name("user_input");
    tainted->set_taint(Taint::kTainted);
    auto safe_var = name("constant");
    safe_var->set_taint(Taint::kSafe);

    EXPECT_EQ(compute_taint(*num(1)), Taint::kSafe);
    EXPECT_EQ(compute_taint(*name("x")), Taint::kUnknown);

    auto call = make_node(Call{.func = safe_var, .args = {num(1), tainted}});
    call->set_taint(Taint::kSafe);
    EXPECT_EQ(compute_taint(*call), Taint::kTainted);

    auto clean = make_node(Call{.func = safe_var, .args = {num(1)}});
    clean->set_taint(Taint::kSafe);
    EXPECT_EQ(compute_taint(*clean), Taint::kSafe);
}

TEST(NodeTest, IdentityHashDependsOnScalarFields)
{
    EXPECT_EQ(str("a")->identity_hash(), str("a")->identity_hash());
    EXPECT_NE(str("a")->identity_hash(), str("b")->identity_hash());
    EXPECT_NE(num(1)->identity_hash(), make_node(Number{1}, 5)->identity_hash());
}

TEST(NodeTest, JsonRendering)
{
    auto node = make_node(Variable{.name = "x", .value = num(1)}, 4);
    node->tags().insert("assigned");
    auto json = to_json(*node);

    EXPECT_EQ(json.at("AST_Type"), "Var");
    EXPECT_EQ(json.at("var_name"), "x");
    EXPECT_EQ(json.at("line_no"), 4);
    EXPECT_EQ(json.at("tags"), nlohmann::json::array({"assigned"}));
    EXPECT_EQ(json.at("value").at("value"), 1);
    EXPECT_FALSE(json.contains("taint"));
}

}  // namespace

}  // namespace pkgaudit::ast::test
