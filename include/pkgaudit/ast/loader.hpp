#pragma once

/**
 * @file loader.hpp
 * @brief Conversion of an external parser's primitive JSON tree into Nodes
 *
 * Input format:
 * @code
 * {"implementation": "cpython-3.11", "ast_tree": {"_type": "Module", "body": [...]}}
 * @endcode
 * Nodes are objects keyed by "_type" in the layout of a Python AST dump.
 */

#include "pkgaudit/ast/nodes.hpp"
#include "pkgaudit/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace pkgaudit::ast {

struct ParsedSource
{
    std::string implementation;  ///< Runtime that produced the tree
    NodePtr root;                ///< Always a Module node
};

/**
 * Convert a primitive tree document.
 * @return ParsedSource or ParseError
 */
[[nodiscard]] pkgaudit::Result<ParsedSource> load_tree(const nlohmann::json& document);

/**
 * Read and convert a primitive tree file.
 * @return ParsedSource, IOError or ParseError
 */
[[nodiscard]] pkgaudit::Result<ParsedSource> load_tree_file(const std::filesystem::path& path);

}  // namespace pkgaudit::ast
