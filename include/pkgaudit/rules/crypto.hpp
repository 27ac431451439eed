#pragma once

/**
 * @file crypto.hpp
 * @brief Detection of asymmetric key generation and weak key sizes
 */

#include "pkgaudit/ast/signature.hpp"
#include "pkgaudit/ast/visitor.hpp"
#include "pkgaudit/config.hpp"

#include <map>
#include <string>
#include <string_view>

namespace pkgaudit::rules {

/**
 * @brief Known key generation entry point.
 */
struct KeyGenerator
{
    std::string family;          ///< "rsa" or "dsa"
    std::string size_parameter;  ///< Parameter carrying the key size in bits
    ast::FormalShape shape;
};

using KeyGeneratorCatalogue = std::map<std::string, KeyGenerator, std::less<>>;

/// Catalogue keyed by fully-qualified function path
[[nodiscard]] const KeyGeneratorCatalogue& key_generator_catalogue();

/**
 * @brief Call rule reporting key generation with a literal key size.
 *
 * The finding score is the configured "crypto-gen-key" score, raised to
 * kMaxScore when the size is below the family's minimum.
 */
class CryptoGenKey final : public ast::NodeRule
{
public:
    static constexpr std::string_view kRuleName = "cryptography_generate_keys";
    static constexpr std::string_view kFindingType = "CryptoKeyGeneration";

    explicit CryptoGenKey(const Config& config);

    [[nodiscard]] std::string_view name() const override { return kRuleName; }
    [[nodiscard]] bool handles(ast::NodeKind kind) const override { return kind == ast::NodeKind::kCall; }
    void visit(ast::Context& context) override;

private:
    const Config& m_config;
};

}  // namespace pkgaudit::rules
