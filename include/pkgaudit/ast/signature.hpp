#pragma once

/**
 * @file signature.hpp
 * @brief Binding of call-site arguments to a formal parameter shape
 */

#include "pkgaudit/ast/nodes.hpp"
#include "pkgaudit/common.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pkgaudit::ast {

enum class ParameterKind {
    kPositionalOnly,
    kPositionalOrKeyword,
    kVarPositional,
    kKeywordOnly,
    kVarKeyword
};

struct Parameter
{
    std::string name;
    ParameterKind kind = ParameterKind::kPositionalOrKeyword;
    bool has_default = false;
    NodePtr default_value;  ///< May be null for a default that has no node (e.g. None)
};

/**
 * @brief Ordered list of formal parameters of a callable.
 *
 * Parameters must be added in declaration order: positional-only,
 * positional-or-keyword, var-positional, keyword-only, var-keyword.
 */
class FormalShape
{
public:
    FormalShape& positional_only(std::string name);
    FormalShape& positional(std::string name);
    FormalShape& positional(std::string name, NodePtr default_value);
    FormalShape& var_positional(std::string name);
    FormalShape& keyword_only(std::string name);
    FormalShape& keyword_only(std::string name, NodePtr default_value);
    FormalShape& var_keyword(std::string name);

    [[nodiscard]] const std::vector<Parameter>& parameters() const noexcept { return m_parameters; }

private:
    std::vector<Parameter> m_parameters;
};

/// Formal shape of a parsed function definition's argument list
[[nodiscard]] FormalShape from_arguments(const Arguments& arguments);

/**
 * @brief Complete mapping from parameter names to argument nodes.
 */
class BoundArguments
{
public:
    /// Bound value of a named parameter; null if unknown or defaulted to nothing
    [[nodiscard]] NodePtr get(std::string_view name) const;

    /// True if the parameter exists in the shape
    [[nodiscard]] bool contains(std::string_view name) const;

    /// True if the call supplied the parameter (as opposed to its default)
    [[nodiscard]] bool is_supplied(std::string_view name) const;

    [[nodiscard]] const std::vector<NodePtr>& var_positional() const noexcept { return m_var_positional; }
    [[nodiscard]] const std::vector<Keyword>& var_keyword() const noexcept { return m_var_keyword; }

private:
    friend pkgaudit::Result<BoundArguments> bind_call(const Call& call, const FormalShape& shape);

    struct Value
    {
        NodePtr node;
        bool supplied = false;
    };

    std::map<std::string, Value, std::less<>> m_values;
    std::vector<NodePtr> m_var_positional;
    std::vector<Keyword> m_var_keyword;
};

/**
 * Bind a call's positional and keyword arguments to a shape.
 *
 * A "**mapping" argument is materialized first and must be a Dictionary with
 * string-literal keys. Either every parameter is bound or the call fails with
 * BindingFailed; the tree is never modified.
 */
[[nodiscard]] pkgaudit::Result<BoundArguments> bind_call(const Call& call, const FormalShape& shape);

}  // namespace pkgaudit::ast
