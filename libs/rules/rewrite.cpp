/**
 * @file rewrite.cpp
 * @brief Import resolution and constant folding
 */

#include "pkgaudit/rules/rewrite.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace pkgaudit::rules {

namespace {

using ast::BinaryOp;
using ast::Import;
using ast::ImportForm;
using ast::NodePtr;
using ast::Number;
using ast::String;

[[nodiscard]] bool multiplication_overflows(std::int64_t lhs, std::int64_t rhs) noexcept
{
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (lhs == 0 || rhs == 0) {
        return false;
    }
    if (lhs > 0) {
        return rhs > 0 ? lhs > kMax / rhs : rhs < kMin / lhs;
    }
    return rhs > 0 ? lhs < kMin / rhs : rhs < kMax / lhs;
}

[[nodiscard]] std::optional<std::int64_t> checked_arithmetic(std::string_view op,
                                                             std::int64_t lhs,
                                                             std::int64_t rhs)
{
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (op == "Add") {
        if ((rhs > 0 && lhs > kMax - rhs) || (rhs < 0 && lhs < kMin - rhs)) {
            return std::nullopt;
        }
        return lhs + rhs;
    }
    if (op == "Sub") {
        if ((rhs < 0 && lhs > kMax + rhs) || (rhs > 0 && lhs < kMin + rhs)) {
            return std::nullopt;
        }
        return lhs - rhs;
    }
    if (op == "Mult") {
        if (multiplication_overflows(lhs, rhs)) {
            return std::nullopt;
        }
        return lhs * rhs;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> repeat(const std::string& text, std::int64_t count)
{
    if (count <= 0) {
        return std::string();
    }
    if (!text.empty()
        && static_cast<std::uint64_t>(count) > ConstantFolding::kMaxFoldedLength / text.size()) {
        return std::nullopt;
    }
    std::string result;
    result.reserve(text.size() * static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        result += text;
    }
    return result;
}

[[nodiscard]] NodePtr fold(const BinaryOp& binop, std::optional<int> line)
{
    if (!binop.left || !binop.right) {
        return nullptr;
    }
    const auto* lhs_str = binop.left->as<String>();
    const auto* rhs_str = binop.right->as<String>();
    const auto* lhs_num = binop.left->as<Number>();
    const auto* rhs_num = binop.right->as<Number>();

    if (binop.op == "Add" && lhs_str != nullptr && rhs_str != nullptr) {
        if (lhs_str->value.size() + rhs_str->value.size() > ConstantFolding::kMaxFoldedLength) {
            return nullptr;
        }
        return ast::make_node(String{lhs_str->value + rhs_str->value}, line);
    }
    if (binop.op == "Mult" && (lhs_str != nullptr || rhs_str != nullptr)) {
        const auto* text = lhs_str != nullptr ? lhs_str : rhs_str;
        const auto* count = lhs_str != nullptr ? rhs_num : lhs_num;
        if (count == nullptr) {
            return nullptr;
        }
        auto repeated = repeat(text->value, count->value);
        return repeated ? ast::make_node(String{std::move(*repeated)}, line) : nullptr;
    }
    if (lhs_num != nullptr && rhs_num != nullptr) {
        auto value = checked_arithmetic(binop.op, lhs_num->value, rhs_num->value);
        return value ? ast::make_node(Number{*value}, line) : nullptr;
    }
    return nullptr;
}

}  // namespace

bool ImportResolver::handles(ast::NodeKind kind) const
{
    return kind == ast::NodeKind::kImport || kind == ast::NodeKind::kVariable;
}

void ImportResolver::visit(ast::Context& context)
{
    const auto& node = context.node();

    if (const auto* import = node->as<Import>()) {
        if (import->form == ImportForm::kImport && import->alias == import->module) {
            // "import a.b" only binds the top-level package
            const auto top = import->module.substr(0, import->module.find('.'));
            m_bindings.insert_or_assign(top, Import{.module = top, .alias = top, .form = import->form});
        } else {
            m_bindings.insert_or_assign(import->alias, *import);
        }
        return;
    }

    const auto* variable = node->as<ast::Variable>();
    if (variable == nullptr || variable->kind != "name" || variable->value) {
        return;
    }
    auto binding = m_bindings.find(variable->name);
    if (binding == m_bindings.end()) {
        return;
    }
    context.replace(ast::make_node(binding->second, node->line_no()));
}

void ConstantFolding::visit(ast::Context& context)
{
    const auto& node = context.node();
    const auto* binop = node->as<BinaryOp>();
    if (binop == nullptr) {
        return;
    }
    if (auto folded = fold(*binop, node->line_no())) {
        context.replace(std::move(folded));
    }
}

std::vector<ast::RulePtr> make_rewrite_rules()
{
    return {std::make_shared<ImportResolver>(), std::make_shared<ConstantFolding>()};
}

}  // namespace pkgaudit::rules
