#pragma once

/**
 * @file visitor.hpp
 * @brief Worklist traversal and rewrite engine over node trees
 *
 * A Traversal visits every slot of a tree in breadth-first order. Each
 * registered NodeRule whose kind predicate accepts the current node sees the
 * node through a Context, through which it may report a Finding or replace the
 * node in its parent slot. Replacing marks the run as modified; callers run
 * further passes until a pass leaves the tree unchanged.
 */

#include "pkgaudit/ast/nodes.hpp"
#include "pkgaudit/finding.hpp"

#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgaudit::ast {

class Context;
class Traversal;

/**
 * @brief A detection or rewrite rule dispatched by node kind.
 */
class NodeRule
{
public:
    virtual ~NodeRule() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual bool handles(NodeKind kind) const = 0;
    virtual void visit(Context& context) = 0;
};

using RulePtr = std::shared_ptr<NodeRule>;

/**
 * @brief One visit of one tree slot. Created only by Traversal.
 */
class Context
{
public:
    [[nodiscard]] const NodePtr& node() const noexcept { return m_node; }
    [[nodiscard]] const std::shared_ptr<const Context>& parent() const noexcept { return m_parent; }
    [[nodiscard]] int depth() const noexcept { return m_depth; }
    /// Field of the parent node holding this slot, e.g. "args[0]"
    [[nodiscard]] const std::string& field() const noexcept { return m_field; }
    /// Scanned artifact the tree was parsed from
    [[nodiscard]] const std::filesystem::path& location() const noexcept;

    /// Overwrite this slot in the parent (or the root) and mark the run modified
    void replace(NodePtr replacement);

    /// Queue a finding for the consumer of the traversal
    void report(Finding finding);

    /// True once any node of the current run has been replaced
    [[nodiscard]] bool modified() const noexcept;

private:
    friend class Traversal;

    struct Token
    {
    };

public:
    Context(Token,
            Traversal& run,
            NodePtr node,
            std::shared_ptr<const Context> parent,
            int depth,
            std::string field,
            std::function<void(NodePtr)> assign);

private:
    Traversal* m_run;
    NodePtr m_node;
    std::shared_ptr<const Context> m_parent;
    int m_depth;
    std::string m_field;
    std::function<void(NodePtr)> m_assign;
};

class Traversal
{
public:
    Traversal(NodePtr root, std::filesystem::path location, std::vector<RulePtr> rules, int max_depth);

    // Queued contexts point back at the run
    Traversal(const Traversal&) = delete;
    Traversal& operator=(const Traversal&) = delete;

    /**
     * Visit the next queued slot.
     * @return false when the queue is exhausted
     */
    bool step();

    /// Visit all remaining slots
    void run();

    /// Pop the oldest reported finding, stepping the traversal as needed
    [[nodiscard]] std::optional<Finding> next_finding();

    [[nodiscard]] bool modified() const noexcept { return m_modified; }
    [[nodiscard]] bool finished() const noexcept { return m_queue.empty(); }
    [[nodiscard]] const NodePtr& root() const noexcept { return m_root; }
    [[nodiscard]] const std::filesystem::path& location() const noexcept { return m_location; }

private:
    friend class Context;

    void enqueue_children(const std::shared_ptr<Context>& context);

    NodePtr m_root;
    std::filesystem::path m_location;
    std::vector<RulePtr> m_rules;
    int m_max_depth;
    std::deque<std::shared_ptr<Context>> m_queue;
    std::deque<Finding> m_findings;
    bool m_modified = false;
};

struct RewriteResult
{
    NodePtr root;
    int passes = 0;
    bool converged = false;  ///< Last pass left the tree unchanged
    std::vector<Finding> findings;
};

/**
 * Run full passes of the rules over a tree until one pass makes no
 * replacement or max_passes is reached.
 */
[[nodiscard]] RewriteResult run_to_fixed_point(NodePtr root,
                                               const std::filesystem::path& location,
                                               const std::vector<RulePtr>& rules,
                                               int max_depth,
                                               int max_passes);

}  // namespace pkgaudit::ast
