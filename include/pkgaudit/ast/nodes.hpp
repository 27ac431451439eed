#pragma once

/**
 * @file nodes.hpp
 * @brief Abstract syntax tree of analyzed source code
 *
 * A Node is a closed variant over the node kinds below plus metadata shared by
 * every kind. Children are held through NodePtr slots; a null slot is an
 * absent child (e.g. a missing return annotation) and is never enumerated.
 */

#include "pkgaudit/ast/taint.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgaudit::ast {

class Node;
using NodePtr = std::shared_ptr<Node>;

struct Number
{
    std::int64_t value = 0;
};

struct String
{
    std::string value;
};

struct Dictionary
{
    std::vector<NodePtr> keys;
    std::vector<NodePtr> values;
};

struct Variable
{
    std::string name;
    NodePtr value;                 ///< Bound value; null for a plain name reference
    std::string kind = "assign";   ///< "assign" or "name"
};

struct Attribute
{
    NodePtr source;
    std::string attr;
    std::string action = "load";
};

struct Compare
{
    NodePtr left;
    std::vector<std::string> ops;
    std::vector<NodePtr> comparators;
};

struct FunctionDef
{
    std::string name;
    NodePtr args;  ///< Arguments node
    std::vector<NodePtr> body;
    std::vector<NodePtr> decorators;
    NodePtr returns;
};

struct Keyword
{
    std::string name;
    NodePtr value;
};

struct Call
{
    NodePtr func;
    std::vector<NodePtr> args;
    std::vector<Keyword> keywords;
    NodePtr keyword_dict;  ///< Expanded "**mapping" argument, if any
};

struct Arguments
{
    std::vector<std::string> args;
    std::optional<std::string> vararg;
    std::vector<std::string> kwonlyargs;
    std::optional<std::string> kwarg;
    std::vector<NodePtr> defaults;     ///< Defaults of the trailing entries of args
    std::vector<NodePtr> kw_defaults;  ///< Aligned with kwonlyargs; null means required
};

enum class ImportForm {
    kImport,  ///< import a.b [as c]
    kFrom     ///< from a import b [as c]
};

struct Import
{
    std::string module;
    std::string alias;
    ImportForm form = ImportForm::kImport;
};

struct BinaryOp
{
    std::string op;
    NodePtr left;
    NodePtr right;
};

struct Print
{
    std::vector<NodePtr> values;
    NodePtr destination;
};

struct Module
{
    std::vector<NodePtr> body;
};

using NodeData = std::variant<Number,
                              String,
                              Dictionary,
                              Variable,
                              Attribute,
                              Compare,
                              FunctionDef,
                              Call,
                              Arguments,
                              Import,
                              BinaryOp,
                              Print,
                              Module>;

/// Mirrors the alternative order of NodeData
enum class NodeKind {
    kNumber,
    kString,
    kDictionary,
    kVariable,
    kAttribute,
    kCompare,
    kFunctionDef,
    kCall,
    kArguments,
    kImport,
    kBinaryOp,
    kPrint,
    kModule
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

struct ChildSlot;

/**
 * Enumerate the non-null direct children of a node, in traversal order.
 * Only the traversal engine mutates trees, through the returned slots.
 */
[[nodiscard]] std::vector<ChildSlot> enumerate_children(const NodePtr& node);

/**
 * @brief A tree node.
 *
 * Node data is read-only for everything but the traversal engine, which
 * replaces children through the slots of enumerate_children().
 */
class Node
{
public:
    explicit Node(NodeData data, std::optional<int> line_no = std::nullopt);

    [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(m_data.index()); }
    [[nodiscard]] const NodeData& data() const noexcept { return m_data; }

    template <typename T>
    [[nodiscard]] const T* as() const noexcept
    {
        return std::get_if<T>(&m_data);
    }

    /**
     * Resolved dotted name of the symbol this node denotes, if any.
     * An explicitly assigned name wins; otherwise it is derived from the
     * node itself and its immediate children only.
     */
    [[nodiscard]] std::optional<std::string> full_name() const;
    void set_full_name(std::string name) { m_full_name = std::move(name); }

    /// True for literals and for compounds built only from static children
    [[nodiscard]] bool is_static() const;

    [[nodiscard]] std::optional<int> line_no() const noexcept { return m_line_no; }
    void set_line_no(int line) noexcept { m_line_no = line; }

    [[nodiscard]] std::set<std::string>& tags() noexcept { return m_tags; }
    [[nodiscard]] const std::set<std::string>& tags() const noexcept { return m_tags; }

    [[nodiscard]] Taint taint() const noexcept { return m_taint; }
    void set_taint(Taint taint) noexcept { m_taint = taint; }

    /// Hash of the node kind and its identifying scalar fields; cached
    [[nodiscard]] std::size_t identity_hash() const;

private:
    friend std::vector<ChildSlot> enumerate_children(const NodePtr& node);

    [[nodiscard]] NodeData& mutable_data() noexcept
    {
        m_hash.reset();
        return m_data;
    }

    NodeData m_data;
    std::optional<std::string> m_full_name;
    std::optional<int> m_line_no;
    std::set<std::string> m_tags;
    mutable std::optional<std::size_t> m_hash;
    Taint m_taint = Taint::kUnknown;
};

template <typename T>
[[nodiscard]] NodePtr make_node(T data, std::optional<int> line_no = std::nullopt)
{
    return std::make_shared<Node>(NodeData{std::move(data)}, line_no);
}

/**
 * @brief One child position of a node.
 *
 * `assign` overwrites the position named by `field` in the owner (a list
 * index, a named field or a keyword name) and keeps the owner alive. The
 * position is looked up again on every call, so an owner whose lists
 * changed since enumeration is never written out of bounds.
 */
struct ChildSlot
{
    NodePtr child;
    std::string field;
    std::function<void(NodePtr)> assign;
};

/**
 * Structural taint: Safe for static nodes, otherwise the combination of the
 * node's own classification with that of all its descendants.
 */
[[nodiscard]] Taint compute_taint(const Node& node);

/// Diagnostic rendering (AST_Type, full_name, tags, line_no, taint)
[[nodiscard]] nlohmann::json to_json(const Node& node);

}  // namespace pkgaudit::ast
