/**
 * @file visitor.cpp
 * @brief Worklist traversal and fixed-point rewriting
 */

#include "pkgaudit/ast/visitor.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace pkgaudit::ast {

Context::Context(Token,
                 Traversal& run,
                 NodePtr node,
                 std::shared_ptr<const Context> parent,
                 int depth,
                 std::string field,
                 std::function<void(NodePtr)> assign)
    : m_run(&run)
    , m_node(std::move(node))
    , m_parent(std::move(parent))
    , m_depth(depth)
    , m_field(std::move(field))
    , m_assign(std::move(assign))
{}

const std::filesystem::path& Context::location() const noexcept
{
    return m_run->m_location;
}

void Context::replace(NodePtr replacement)
{
    if (m_assign) {
        m_assign(replacement);
    } else {
        m_run->m_root = replacement;
    }
    m_node = std::move(replacement);
    m_run->m_modified = true;
}

void Context::report(Finding finding)
{
    m_run->m_findings.push_back(std::move(finding));
}

bool Context::modified() const noexcept
{
    return m_run->m_modified;
}

Traversal::Traversal(NodePtr root,
                     std::filesystem::path location,
                     std::vector<RulePtr> rules,
                     int max_depth)
    : m_root(std::move(root))
    , m_location(std::move(location))
    , m_rules(std::move(rules))
    , m_max_depth(max_depth)
{
    if (m_root) {
        m_queue.push_back(
            std::make_shared<Context>(Context::Token{}, *this, m_root, nullptr, 0, "", nullptr));
    }
}

bool Traversal::step()
{
    if (m_queue.empty()) {
        return false;
    }
    auto context = std::move(m_queue.front());
    m_queue.pop_front();

    for (const auto& rule : m_rules) {
        // A previous rule may have replaced or removed the node
        if (!context->node()) {
            break;
        }
        if (rule->handles(context->node()->kind())) {
            rule->visit(*context);
        }
    }
    enqueue_children(context);
    return true;
}

void Traversal::run()
{
    while (step()) {
    }
}

std::optional<Finding> Traversal::next_finding()
{
    while (m_findings.empty()) {
        if (!step()) {
            return std::nullopt;
        }
    }
    auto finding = std::move(m_findings.front());
    m_findings.pop_front();
    return finding;
}

void Traversal::enqueue_children(const std::shared_ptr<Context>& context)
{
    if (!context->node()) {
        return;
    }
    auto children = enumerate_children(context->node());
    if (children.empty()) {
        return;
    }
    const int child_depth = context->depth() + 1;
    if (child_depth > m_max_depth) {
        spdlog::debug("Traversal depth limit {} reached at {} node in '{}'",
                      m_max_depth,
                      to_string(context->node()->kind()),
                      m_location.string());
        return;
    }
    for (auto& slot : children) {
        m_queue.push_back(std::make_shared<Context>(Context::Token{},
                                                    *this,
                                                    std::move(slot.child),
                                                    context,
                                                    child_depth,
                                                    std::move(slot.field),
                                                    std::move(slot.assign)));
    }
}

RewriteResult run_to_fixed_point(NodePtr root,
                                 const std::filesystem::path& location,
                                 const std::vector<RulePtr>& rules,
                                 int max_depth,
                                 int max_passes)
{
    RewriteResult result{.root = std::move(root)};
    while (result.passes < max_passes) {
        Traversal traversal(result.root, location, rules, max_depth);
        while (auto finding = traversal.next_finding()) {
            result.findings.push_back(std::move(*finding));
        }
        ++result.passes;
        result.root = traversal.root();
        if (!traversal.modified()) {
            result.converged = true;
            break;
        }
    }
    spdlog::debug("Rewrite of '{}' finished after {} pass(es){}",
                  location.string(),
                  result.passes,
                  result.converged ? "" : " without converging");
    return result;
}

}  // namespace pkgaudit::ast
