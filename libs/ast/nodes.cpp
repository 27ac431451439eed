/**
 * @file nodes.cpp
 * @brief Tree node metadata, child slots and diagnostic rendering
 */

#include "pkgaudit/ast/nodes.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace pkgaudit::ast {

namespace {

[[nodiscard]] std::string indexed(std::string_view field, std::size_t index)
{
    return std::format("{}[{}]", field, index);
}

/**
 * Invoke fn(slot, field) for every child slot of one alternative, null slots
 * included. Works on both const and mutable node data.
 */
template <typename Data, typename Fn>
void for_each_slot(Data& data, Fn&& fn)
{
    using T = std::remove_cvref_t<Data>;
    if constexpr (std::is_same_v<T, Dictionary>) {
        for (std::size_t i = 0; i < data.keys.size(); ++i) {
            fn(data.keys[i], indexed("keys", i));
        }
        for (std::size_t i = 0; i < data.values.size(); ++i) {
            fn(data.values[i], indexed("values", i));
        }
    } else if constexpr (std::is_same_v<T, Variable>) {
        fn(data.value, "value");
    } else if constexpr (std::is_same_v<T, Attribute>) {
        fn(data.source, "source");
    } else if constexpr (std::is_same_v<T, Compare>) {
        fn(data.left, "left");
        for (std::size_t i = 0; i < data.comparators.size(); ++i) {
            fn(data.comparators[i], indexed("comparators", i));
        }
    } else if constexpr (std::is_same_v<T, FunctionDef>) {
        fn(data.args, "args");
        for (std::size_t i = 0; i < data.body.size(); ++i) {
            fn(data.body[i], indexed("body", i));
        }
        for (std::size_t i = 0; i < data.decorators.size(); ++i) {
            fn(data.decorators[i], indexed("decorators", i));
        }
        fn(data.returns, "returns");
    } else if constexpr (std::is_same_v<T, Call>) {
        for (std::size_t i = 0; i < data.args.size(); ++i) {
            fn(data.args[i], indexed("args", i));
        }
        for (auto& keyword : data.keywords) {
            fn(keyword.value, std::format("keywords[{}]", keyword.name));
        }
        fn(data.keyword_dict, "keyword_dict");
        fn(data.func, "func");
    } else if constexpr (std::is_same_v<T, Arguments>) {
        for (std::size_t i = 0; i < data.defaults.size(); ++i) {
            fn(data.defaults[i], indexed("defaults", i));
        }
        for (std::size_t i = 0; i < data.kw_defaults.size(); ++i) {
            fn(data.kw_defaults[i], indexed("kw_defaults", i));
        }
    } else if constexpr (std::is_same_v<T, BinaryOp>) {
        fn(data.left, "left");
        fn(data.right, "right");
    } else if constexpr (std::is_same_v<T, Print>) {
        for (std::size_t i = 0; i < data.values.size(); ++i) {
            fn(data.values[i], indexed("values", i));
        }
        fn(data.destination, "destination");
    } else if constexpr (std::is_same_v<T, Module>) {
        for (std::size_t i = 0; i < data.body.size(); ++i) {
            fn(data.body[i], indexed("body", i));
        }
    }
    // Number, String and Import have no child nodes.
}

template <typename DataT, typename Fn>
void for_each_child_slot(DataT& data, Fn&& fn)
{
    std::visit([&fn](auto& alternative) { for_each_slot(alternative, fn); }, data);
}

/// Overwrite the slot named by field; false if the owner has no such slot
bool assign_slot(NodeData& data, const std::string& field, NodePtr value)
{
    bool assigned = false;
    for_each_child_slot(data, [&](NodePtr& slot, const std::string& name) {
        if (!assigned && name == field) {
            slot = std::move(value);
            assigned = true;
        }
    });
    return assigned;
}

[[nodiscard]] bool static_slot(const NodePtr& slot)
{
    return slot != nullptr && slot->is_static();
}

void hash_mix(std::size_t& seed, std::size_t value) noexcept
{
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
}

[[nodiscard]] nlohmann::json child_json(const NodePtr& node)
{
    return node ? to_json(*node) : nlohmann::json(nullptr);
}

[[nodiscard]] nlohmann::json children_json(const std::vector<NodePtr>& nodes)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& node : nodes) {
        out.push_back(child_json(node));
    }
    return out;
}

}  // namespace

std::string_view to_string(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::kNumber:
            return "Number";
        case NodeKind::kString:
            return "String";
        case NodeKind::kDictionary:
            return "Dictionary";
        case NodeKind::kVariable:
            return "Var";
        case NodeKind::kAttribute:
            return "Attribute";
        case NodeKind::kCompare:
            return "Compare";
        case NodeKind::kFunctionDef:
            return "FunctionDef";
        case NodeKind::kCall:
            return "Call";
        case NodeKind::kArguments:
            return "Arguments";
        case NodeKind::kImport:
            return "Import";
        case NodeKind::kBinaryOp:
            return "BinOp";
        case NodeKind::kPrint:
            return "Print";
        case NodeKind::kModule:
            return "Module";
    }
    return "Unknown";
}

Node::Node(NodeData data, std::optional<int> line_no)
    : m_data(std::move(data))
    , m_line_no(line_no)
{}

std::optional<std::string> Node::full_name() const
{
    if (m_full_name.has_value()) {
        return m_full_name;
    }
    if (const auto* import = as<Import>()) {
        return import->module;
    }
    if (const auto* attribute = as<Attribute>()) {
        const auto& source = attribute->source;
        if (!source
            || (source->kind() != NodeKind::kImport && source->kind() != NodeKind::kAttribute)) {
            return std::nullopt;
        }
        if (auto prefix = source->full_name()) {
            return *prefix + "." + attribute->attr;
        }
        return std::nullopt;
    }
    if (const auto* call = as<Call>()) {
        return call->func ? call->func->full_name() : std::nullopt;
    }
    if (const auto* variable = as<Variable>()) {
        if (variable->value) {
            return variable->value->full_name();
        }
        if (variable->kind == "name") {
            return variable->name;
        }
    }
    return std::nullopt;
}

bool Node::is_static() const
{
    switch (kind()) {
        case NodeKind::kNumber:
        case NodeKind::kString:
            return true;
        case NodeKind::kDictionary: {
            const auto& dict = std::get<Dictionary>(m_data);
            return std::ranges::all_of(dict.keys, static_slot)
                   && std::ranges::all_of(dict.values, static_slot);
        }
        case NodeKind::kBinaryOp: {
            const auto& binop = std::get<BinaryOp>(m_data);
            return static_slot(binop.left) && static_slot(binop.right);
        }
        default:
            return false;
    }
}

std::size_t Node::identity_hash() const
{
    if (m_hash.has_value()) {
        return *m_hash;
    }

    std::size_t seed = std::hash<std::size_t>{}(m_data.index());
    hash_mix(seed, std::hash<int>{}(m_line_no.value_or(-1)));
    const std::hash<std::string> hash_str;
    std::visit(
        [&seed, &hash_str](const auto& data) {
            using T = std::remove_cvref_t<decltype(data)>;
            if constexpr (std::is_same_v<T, Number>) {
                hash_mix(seed, std::hash<std::int64_t>{}(data.value));
            } else if constexpr (std::is_same_v<T, String>) {
                hash_mix(seed, hash_str(data.value));
            } else if constexpr (std::is_same_v<T, Variable>) {
                hash_mix(seed, hash_str(data.name));
            } else if constexpr (std::is_same_v<T, Attribute>) {
                hash_mix(seed, hash_str(data.attr));
            } else if constexpr (std::is_same_v<T, FunctionDef>) {
                hash_mix(seed, hash_str(data.name));
            } else if constexpr (std::is_same_v<T, Import>) {
                hash_mix(seed, hash_str(data.module));
                hash_mix(seed, hash_str(data.alias));
            } else if constexpr (std::is_same_v<T, BinaryOp>) {
                hash_mix(seed, hash_str(data.op));
            }
        },
        m_data);

    m_hash = seed;
    return seed;
}

std::vector<ChildSlot> enumerate_children(const NodePtr& node)
{
    std::vector<ChildSlot> slots;
    if (!node) {
        return slots;
    }
    // The variant lives as long as its owner; the slot inside it is looked up
    // again by field on every assignment
    NodeData* data = &node->mutable_data();
    for_each_child_slot(node->data(), [&slots, &node, data](const NodePtr& slot, std::string field) {
        if (!slot) {
            return;
        }
        slots.push_back(ChildSlot{
            .child = slot,
            .field = field,
            .assign = [owner = node, data, field](NodePtr value) {
                if (!assign_slot(*data, field, std::move(value))) {
                    spdlog::debug("Slot '{}' no longer exists in {} node", field, to_string(owner->kind()));
                }
            },
        });
    });
    return slots;
}

Taint compute_taint(const Node& node)
{
    if (node.is_static()) {
        return Taint::kSafe;
    }
    Taint result = node.taint();
    for_each_child_slot(node.data(), [&result](const NodePtr& slot, const std::string&) {
        if (slot) {
            result = combine(result, compute_taint(*slot));
        }
    });
    return result;
}

nlohmann::json to_json(const Node& node)
{
    nlohmann::json data = {
        {"AST_Type", to_string(node.kind())}
    };
    if (auto name = node.full_name()) {
        data["full_name"] = *name;
    }
    if (!node.tags().empty()) {
        data["tags"] = node.tags();
    }
    if (node.line_no().has_value()) {
        data["line_no"] = *node.line_no();
    }
    if (node.taint() != Taint::kUnknown) {
        data["taint"] = to_string(node.taint());
    }

    std::visit(
        [&data](const auto& alt) {
            using T = std::remove_cvref_t<decltype(alt)>;
            if constexpr (std::is_same_v<T, Number> || std::is_same_v<T, String>) {
                data["value"] = alt.value;
            } else if constexpr (std::is_same_v<T, Dictionary>) {
                data["keys"] = children_json(alt.keys);
                data["values"] = children_json(alt.values);
            } else if constexpr (std::is_same_v<T, Variable>) {
                data["var_name"] = alt.name;
                data["value"] = child_json(alt.value);
                data["var_type"] = alt.kind;
            } else if constexpr (std::is_same_v<T, Attribute>) {
                data["source"] = child_json(alt.source);
                data["attr"] = alt.attr;
                data["action"] = alt.action;
            } else if constexpr (std::is_same_v<T, Compare>) {
                data["left"] = child_json(alt.left);
                data["ops"] = alt.ops;
                data["comparators"] = children_json(alt.comparators);
            } else if constexpr (std::is_same_v<T, FunctionDef>) {
                data["function_name"] = alt.name;
                data["args"] = child_json(alt.args);
                data["body"] = children_json(alt.body);
                data["decorator_list"] = children_json(alt.decorators);
            } else if constexpr (std::is_same_v<T, Call>) {
                data["func"] = child_json(alt.func);
                data["args"] = children_json(alt.args);
                nlohmann::json kwargs = nlohmann::json::object();
                for (const auto& keyword : alt.keywords) {
                    kwargs[keyword.name] = child_json(keyword.value);
                }
                data["kwargs"] = std::move(kwargs);
                if (alt.keyword_dict) {
                    data["kwargs_dict"] = child_json(alt.keyword_dict);
                }
            } else if constexpr (std::is_same_v<T, Arguments>) {
                data["args"] = alt.args;
                data["vararg"] = alt.vararg ? nlohmann::json(*alt.vararg) : nlohmann::json(nullptr);
                data["kwonlyargs"] = alt.kwonlyargs;
                data["kwarg"] = alt.kwarg ? nlohmann::json(*alt.kwarg) : nlohmann::json(nullptr);
                data["defaults"] = children_json(alt.defaults);
                data["kw_defaults"] = children_json(alt.kw_defaults);
            } else if constexpr (std::is_same_v<T, Import>) {
                data["module"] = alt.module;
                data["alias"] = alt.alias;
                data["import_type"] = alt.form == ImportForm::kFrom ? "from" : "import";
            } else if constexpr (std::is_same_v<T, BinaryOp>) {
                data["op"] = alt.op;
                data["left"] = child_json(alt.left);
                data["right"] = child_json(alt.right);
            } else if constexpr (std::is_same_v<T, Print>) {
                data["values"] = children_json(alt.values);
                data["dest"] = child_json(alt.destination);
            } else if constexpr (std::is_same_v<T, Module>) {
                data["body"] = children_json(alt.body);
            }
        },
        node.data());
    return data;
}

}  // namespace pkgaudit::ast
