/**
 * @file loader.cpp
 * @brief Primitive tree conversion
 */

#include "pkgaudit/ast/loader.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace pkgaudit::ast {

namespace {

using Json = nlohmann::json;

/// Statement-list fields of compound statements we do not model
constexpr std::array<std::string_view, 4> kNestedBodies = {"body", "orelse", "finalbody", "handlers"};

[[nodiscard]] std::string node_type(const Json& node)
{
    if (!node.is_object() || !node.contains("_type")) {
        return {};
    }
    return node.at("_type").get<std::string>();
}

[[nodiscard]] std::optional<int> line_of(const Json& node)
{
    if (node.is_object() && node.contains("lineno") && node.at("lineno").is_number_integer()) {
        return node.at("lineno").get<int>();
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> optional_string(const Json& node, const char* key)
{
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<std::string>();
}

class TreeConverter
{
public:
    [[nodiscard]] NodePtr module(const Json& node)
    {
        Module result;
        statements(node.at("body"), result.body);
        return make_node(std::move(result), line_of(node));
    }

private:
    void statements(const Json& list, std::vector<NodePtr>& out)
    {
        if (!list.is_array()) {
            return;
        }
        for (const auto& item : list) {
            statement(item, out);
        }
    }

    void statement(const Json& node, std::vector<NodePtr>& out)
    {
        const std::string type = node_type(node);
        const auto line = line_of(node);

        if (type == "Expr" || type == "Return") {
            if (auto value = expression(node.value("value", Json())); value) {
                out.push_back(std::move(value));
            }
        } else if (type == "Assign") {
            assignment(node, out);
        } else if (type == "Import") {
            for (const auto& alias : node.at("names")) {
                const auto name = alias.at("name").get<std::string>();
                out.push_back(make_node(Import{.module = name,
                                               .alias = optional_string(alias, "asname").value_or(name),
                                               .form = ImportForm::kImport},
                                        line));
            }
        } else if (type == "ImportFrom") {
            const auto module = optional_string(node, "module").value_or("");
            for (const auto& alias : node.at("names")) {
                const auto name = alias.at("name").get<std::string>();
                out.push_back(make_node(Import{.module = module.empty() ? name : module + "." + name,
                                               .alias = optional_string(alias, "asname").value_or(name),
                                               .form = ImportForm::kFrom},
                                        line));
            }
        } else if (type == "FunctionDef" || type == "AsyncFunctionDef") {
            out.push_back(function_def(node));
        } else if (type == "Print") {
            Print print;
            expressions(node.at("values"), print.values);
            print.destination = expression(node.value("dest", Json()));
            out.push_back(make_node(std::move(print), line));
        } else {
            // Unmodelled compound statement: hoist its nested statements
            bool hoisted = false;
            for (std::string_view field : kNestedBodies) {
                const std::string key(field);
                if (node.contains(key) && node.at(key).is_array()) {
                    statements(node.at(key), out);
                    hoisted = true;
                }
            }
            if (!hoisted) {
                if (auto value = expression(node); value) {
                    out.push_back(std::move(value));
                }
            }
        }
    }

    void assignment(const Json& node, std::vector<NodePtr>& out)
    {
        auto value = expression(node.at("value"));
        const auto& targets = node.at("targets");
        if (targets.size() == 1 && node_type(targets.at(0)) == "Name") {
            out.push_back(make_node(Variable{.name = targets.at(0).at("id").get<std::string>(),
                                             .value = std::move(value),
                                             .kind = "assign"},
                                    line_of(node)));
            return;
        }
        if (value) {
            out.push_back(std::move(value));
        }
    }

    void expressions(const Json& list, std::vector<NodePtr>& out)
    {
        if (!list.is_array()) {
            return;
        }
        for (const auto& item : list) {
            out.push_back(expression(item));
        }
    }

    [[nodiscard]] NodePtr expression(const Json& node)
    {
        const std::string type = node_type(node);
        const auto line = line_of(node);

        if (type == "Name") {
            return make_node(Variable{.name = node.at("id").get<std::string>(), .kind = "name"}, line);
        }
        if (type == "Num") {
            return number(node.at("n"), line);
        }
        if (type == "Str") {
            return make_node(String{node.at("s").get<std::string>()}, line);
        }
        if (type == "Constant") {
            const auto& value = node.at("value");
            if (value.is_string()) {
                return make_node(String{value.get<std::string>()}, line);
            }
            return number(value, line);
        }
        if (type == "Attribute") {
            std::string action = "load";
            if (node.contains("ctx")) {
                action = node_type(node.at("ctx"));
                for (auto& ch : action) {
                    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                }
            }
            return make_node(Attribute{.source = expression(node.at("value")),
                                       .attr = node.at("attr").get<std::string>(),
                                       .action = std::move(action)},
                             line);
        }
        if (type == "Call") {
            return call(node);
        }
        if (type == "Dict") {
            Dictionary dict;
            expressions(node.at("keys"), dict.keys);
            expressions(node.at("values"), dict.values);
            return make_node(std::move(dict), line);
        }
        if (type == "Compare") {
            Compare compare{.left = expression(node.at("left"))};
            for (const auto& op : node.at("ops")) {
                compare.ops.push_back(node_type(op));
            }
            expressions(node.at("comparators"), compare.comparators);
            return make_node(std::move(compare), line);
        }
        if (type == "BinOp") {
            return make_node(BinaryOp{.op = node_type(node.at("op")),
                                      .left = expression(node.at("left")),
                                      .right = expression(node.at("right"))},
                             line);
        }
        if (type == "arguments") {
            return arguments(node);
        }
        return nullptr;
    }

    [[nodiscard]] static NodePtr number(const Json& value, std::optional<int> line)
    {
        // Floats, booleans, None and integers outside int64 are not modelled
        if (!value.is_number_integer()) {
            return nullptr;
        }
        if (value.is_number_unsigned()
            && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return nullptr;
        }
        return make_node(Number{value.get<std::int64_t>()}, line);
    }

    [[nodiscard]] NodePtr call(const Json& node)
    {
        Call result{.func = expression(node.at("func"))};
        expressions(node.at("args"), result.args);
        for (const auto& keyword : node.value("keywords", Json::array())) {
            auto arg = optional_string(keyword, "arg");
            auto value = expression(keyword.at("value"));
            if (arg.has_value()) {
                result.keywords.push_back(Keyword{.name = std::move(*arg), .value = std::move(value)});
            } else if (!result.keyword_dict) {
                result.keyword_dict = std::move(value);
            }
        }
        return make_node(std::move(result), line_of(node));
    }

    [[nodiscard]] NodePtr arguments(const Json& node)
    {
        Arguments result;
        for (const char* key : {"posonlyargs", "args"}) {
            for (const auto& arg : node.value(key, Json::array())) {
                result.args.push_back(arg.at("arg").get<std::string>());
            }
        }
        for (const auto& arg : node.value("kwonlyargs", Json::array())) {
            result.kwonlyargs.push_back(arg.at("arg").get<std::string>());
        }
        if (node.contains("vararg") && node.at("vararg").is_object()) {
            result.vararg = node.at("vararg").at("arg").get<std::string>();
        }
        if (node.contains("kwarg") && node.at("kwarg").is_object()) {
            result.kwarg = node.at("kwarg").at("arg").get<std::string>();
        }
        expressions(node.value("defaults", Json::array()), result.defaults);
        expressions(node.value("kw_defaults", Json::array()), result.kw_defaults);
        result.kw_defaults.resize(result.kwonlyargs.size());
        return make_node(std::move(result), line_of(node));
    }

    [[nodiscard]] NodePtr function_def(const Json& node)
    {
        FunctionDef result{.name = node.at("name").get<std::string>(),
                           .args = expression(node.at("args"))};
        statements(node.at("body"), result.body);
        expressions(node.value("decorator_list", Json::array()), result.decorators);
        result.returns = expression(node.value("returns", Json()));
        return make_node(std::move(result), line_of(node));
    }
};

}  // namespace

pkgaudit::Result<ParsedSource> load_tree(const nlohmann::json& document)
{
    if (!document.is_object() || !document.contains("ast_tree")) {
        return std::unexpected(Error::make("ParseError", "Document has no ast_tree"));
    }
    ParsedSource parsed;
    try {
        const auto& tree = document.at("ast_tree");
        if (node_type(tree) != "Module") {
            return std::unexpected(Error::make("ParseError", "Tree root must be a Module node"));
        }
        parsed.implementation = document.value("implementation", std::string("unknown"));
        parsed.root = TreeConverter{}.module(tree);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("ParseError", std::string("Malformed tree: ") + ex.what()));
    }
    return parsed;
}

pkgaudit::Result<ParsedSource> load_tree_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open tree file: " + path.string()));
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", "Failed to parse tree file: " + path.string() + ": " + ex.what()));
    }
    return load_tree(document);
}

}  // namespace pkgaudit::ast
