#pragma once

/**
 * @file rewrite.hpp
 * @brief Tree rewrite rules run to a fixed point before detection
 */

#include "pkgaudit/ast/visitor.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pkgaudit::rules {

/**
 * @brief Replaces references to imported names with their Import node.
 *
 * "import a.b" binds a, "import a.b as c" binds c to a.b and
 * "from a import b as c" binds c to a.b. Bindings persist across passes.
 */
class ImportResolver final : public ast::NodeRule
{
public:
    [[nodiscard]] std::string_view name() const override { return "import_resolver"; }
    [[nodiscard]] bool handles(ast::NodeKind kind) const override;
    void visit(ast::Context& context) override;

    [[nodiscard]] const std::map<std::string, ast::Import, std::less<>>& bindings() const noexcept
    {
        return m_bindings;
    }

private:
    std::map<std::string, ast::Import, std::less<>> m_bindings;
};

/**
 * @brief Folds binary operations over literals.
 *
 * String + String, String * Number, Number * String and
 * Number (+|-|*) Number. Results that overflow or would exceed
 * kMaxFoldedLength characters are left unfolded.
 */
class ConstantFolding final : public ast::NodeRule
{
public:
    static constexpr std::size_t kMaxFoldedLength = 1U << 20U;

    [[nodiscard]] std::string_view name() const override { return "constant_folding"; }
    [[nodiscard]] bool handles(ast::NodeKind kind) const override
    {
        return kind == ast::NodeKind::kBinaryOp;
    }
    void visit(ast::Context& context) override;
};

/// Fresh instances of the rewrite rules, in application order
[[nodiscard]] std::vector<ast::RulePtr> make_rewrite_rules();

}  // namespace pkgaudit::rules
