/**
 * @file signature.cpp
 * @brief Call argument binding
 */

#include "pkgaudit/ast/signature.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace pkgaudit::ast {

namespace {

[[nodiscard]] Error binding_error(std::string message)
{
    return Error::make("BindingFailed", std::move(message));
}

[[nodiscard]] bool accepts_positional(ParameterKind kind) noexcept
{
    return kind == ParameterKind::kPositionalOnly || kind == ParameterKind::kPositionalOrKeyword;
}

[[nodiscard]] bool accepts_keyword(ParameterKind kind) noexcept
{
    return kind == ParameterKind::kPositionalOrKeyword || kind == ParameterKind::kKeywordOnly;
}

/// Explicit keywords followed by the entries of a "**{...}" argument
[[nodiscard]] pkgaudit::Result<std::vector<Keyword>> materialize_keywords(const Call& call)
{
    std::vector<Keyword> keywords = call.keywords;
    if (!call.keyword_dict) {
        return keywords;
    }

    const auto* dict = call.keyword_dict->as<Dictionary>();
    if (dict == nullptr || dict->keys.size() != dict->values.size()) {
        return std::unexpected(binding_error("keyword expansion is not a dictionary literal"));
    }
    for (std::size_t i = 0; i < dict->keys.size(); ++i) {
        const auto& key = dict->keys[i];
        const auto* name = key ? key->as<String>() : nullptr;
        if (name == nullptr) {
            return std::unexpected(binding_error("keyword expansion has a non-string key"));
        }
        const bool duplicate = std::ranges::any_of(
            keywords, [name](const Keyword& keyword) { return keyword.name == name->value; });
        if (duplicate) {
            return std::unexpected(
                binding_error(std::format("got multiple values for keyword argument '{}'", name->value)));
        }
        keywords.push_back(Keyword{.name = name->value, .value = dict->values[i]});
    }
    return keywords;
}

}  // namespace

FormalShape& FormalShape::positional_only(std::string name)
{
    m_parameters.push_back(Parameter{.name = std::move(name), .kind = ParameterKind::kPositionalOnly});
    return *this;
}

FormalShape& FormalShape::positional(std::string name)
{
    m_parameters.push_back(
        Parameter{.name = std::move(name), .kind = ParameterKind::kPositionalOrKeyword});
    return *this;
}

FormalShape& FormalShape::positional(std::string name, NodePtr default_value)
{
    m_parameters.push_back(Parameter{.name = std::move(name),
                                     .kind = ParameterKind::kPositionalOrKeyword,
                                     .has_default = true,
                                     .default_value = std::move(default_value)});
    return *this;
}

FormalShape& FormalShape::var_positional(std::string name)
{
    m_parameters.push_back(Parameter{.name = std::move(name), .kind = ParameterKind::kVarPositional});
    return *this;
}

FormalShape& FormalShape::keyword_only(std::string name)
{
    m_parameters.push_back(Parameter{.name = std::move(name), .kind = ParameterKind::kKeywordOnly});
    return *this;
}

FormalShape& FormalShape::keyword_only(std::string name, NodePtr default_value)
{
    m_parameters.push_back(Parameter{.name = std::move(name),
                                     .kind = ParameterKind::kKeywordOnly,
                                     .has_default = true,
                                     .default_value = std::move(default_value)});
    return *this;
}

FormalShape& FormalShape::var_keyword(std::string name)
{
    m_parameters.push_back(Parameter{.name = std::move(name), .kind = ParameterKind::kVarKeyword});
    return *this;
}

FormalShape from_arguments(const Arguments& arguments)
{
    FormalShape shape;

    // Defaults belong to the trailing positional parameters
    const std::size_t first_default = arguments.args.size() > arguments.defaults.size()
                                          ? arguments.args.size() - arguments.defaults.size()
                                          : 0;
    for (std::size_t i = 0; i < arguments.args.size(); ++i) {
        if (i < first_default) {
            shape.positional(arguments.args[i]);
        } else {
            shape.positional(arguments.args[i], arguments.defaults[i - first_default]);
        }
    }
    if (arguments.vararg.has_value()) {
        shape.var_positional(*arguments.vararg);
    }
    for (std::size_t i = 0; i < arguments.kwonlyargs.size(); ++i) {
        if (i < arguments.kw_defaults.size() && arguments.kw_defaults[i]) {
            shape.keyword_only(arguments.kwonlyargs[i], arguments.kw_defaults[i]);
        } else {
            shape.keyword_only(arguments.kwonlyargs[i]);
        }
    }
    if (arguments.kwarg.has_value()) {
        shape.var_keyword(*arguments.kwarg);
    }
    return shape;
}

NodePtr BoundArguments::get(std::string_view name) const
{
    auto it = m_values.find(name);
    return it == m_values.end() ? nullptr : it->second.node;
}

bool BoundArguments::contains(std::string_view name) const
{
    return m_values.contains(name);
}

bool BoundArguments::is_supplied(std::string_view name) const
{
    auto it = m_values.find(name);
    return it != m_values.end() && it->second.supplied;
}

pkgaudit::Result<BoundArguments> bind_call(const Call& call, const FormalShape& shape)
{
    auto keywords = materialize_keywords(call);
    if (!keywords) {
        return std::unexpected(keywords.error());
    }

    const auto& parameters = shape.parameters();
    const bool has_var_positional = std::ranges::any_of(
        parameters, [](const Parameter& p) { return p.kind == ParameterKind::kVarPositional; });
    const bool has_var_keyword = std::ranges::any_of(
        parameters, [](const Parameter& p) { return p.kind == ParameterKind::kVarKeyword; });

    BoundArguments bound;

    // Positional arguments fill positional parameters in declaration order
    std::size_t next_arg = 0;
    for (const auto& parameter : parameters) {
        if (next_arg == call.args.size() || !accepts_positional(parameter.kind)) {
            break;
        }
        bound.m_values[parameter.name] =
            BoundArguments::Value{.node = call.args[next_arg++], .supplied = true};
    }
    if (next_arg < call.args.size()) {
        if (!has_var_positional) {
            const auto accepted = std::ranges::count_if(
                parameters, [](const Parameter& p) { return accepts_positional(p.kind); });
            return std::unexpected(binding_error(std::format(
                "takes {} positional arguments but {} were given", accepted, call.args.size())));
        }
        bound.m_var_positional.assign(call.args.begin() + static_cast<std::ptrdiff_t>(next_arg),
                                      call.args.end());
    }

    for (auto& keyword : *keywords) {
        auto parameter = std::ranges::find_if(parameters, [&keyword](const Parameter& p) {
            return p.name == keyword.name && accepts_keyword(p.kind);
        });
        if (parameter == parameters.end()) {
            if (!has_var_keyword) {
                return std::unexpected(
                    binding_error(std::format("got an unexpected keyword argument '{}'", keyword.name)));
            }
            bound.m_var_keyword.push_back(std::move(keyword));
            continue;
        }
        if (bound.m_values.contains(parameter->name)) {
            return std::unexpected(
                binding_error(std::format("got multiple values for argument '{}'", parameter->name)));
        }
        bound.m_values[parameter->name] =
            BoundArguments::Value{.node = std::move(keyword.value), .supplied = true};
    }

    for (const auto& parameter : parameters) {
        if (parameter.kind == ParameterKind::kVarPositional
            || parameter.kind == ParameterKind::kVarKeyword || bound.m_values.contains(parameter.name)) {
            continue;
        }
        if (!parameter.has_default) {
            return std::unexpected(
                binding_error(std::format("missing a required argument: '{}'", parameter.name)));
        }
        bound.m_values[parameter.name] =
            BoundArguments::Value{.node = parameter.default_value, .supplied = false};
    }
    return bound;
}

}  // namespace pkgaudit::ast
