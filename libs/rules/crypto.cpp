/**
 * @file crypto.cpp
 * @brief Key generation catalogue and rule
 */

#include "pkgaudit/rules/crypto.hpp"

#include "pkgaudit/finding.hpp"

#include <string>
#include <utility>

namespace pkgaudit::rules {

namespace {

/// generate_private_key(key_size, backend=None), RSA adds keyword-only public_exponent
[[nodiscard]] KeyGenerator cryptography_generator(std::string family)
{
    KeyGenerator generator{.family = std::move(family), .size_parameter = "key_size"};
    generator.shape.positional("key_size").positional("backend", nullptr);
    if (generator.family == "rsa") {
        generator.shape.keyword_only("public_exponent", nullptr);
    }
    return generator;
}

/// generate(bits, randfunc=None, domain=None), RSA adds keyword-only e
[[nodiscard]] KeyGenerator pycrypto_generator(std::string family)
{
    KeyGenerator generator{.family = std::move(family), .size_parameter = "bits"};
    generator.shape.positional("bits").positional("randfunc", nullptr).positional("domain", nullptr);
    if (generator.family == "rsa") {
        generator.shape.keyword_only("e", nullptr);
    }
    return generator;
}

[[nodiscard]] KeyGeneratorCatalogue build_catalogue()
{
    KeyGeneratorCatalogue catalogue;
    const std::string hazmat = "cryptography.hazmat.primitives.asymmetric.";
    for (const char* family : {"dsa", "rsa"}) {
        for (const char* function : {"generate_private_key", "generate_parameters"}) {
            catalogue.emplace(hazmat + family + "." + function, cryptography_generator(family));
        }
    }
    for (const char* package : {"Crypto", "Cryptodome"}) {
        catalogue.emplace(std::string(package) + ".PublicKey.DSA.generate", pycrypto_generator("dsa"));
        catalogue.emplace(std::string(package) + ".PublicKey.RSA.generate", pycrypto_generator("rsa"));
    }
    return catalogue;
}

}  // namespace

const KeyGeneratorCatalogue& key_generator_catalogue()
{
    static const KeyGeneratorCatalogue catalogue = build_catalogue();
    return catalogue;
}

CryptoGenKey::CryptoGenKey(const Config& config)
    : m_config(config)
{}

void CryptoGenKey::visit(ast::Context& context)
{
    const auto& node = context.node();
    const auto* call = node->as<ast::Call>();
    auto function = node->full_name();
    if (call == nullptr || !function.has_value()) {
        return;
    }

    const auto& catalogue = key_generator_catalogue();
    auto entry = catalogue.find(*function);
    if (entry == catalogue.end()) {
        return;
    }
    const KeyGenerator& generator = entry->second;

    // Calls that do not fit the declared shape are not reported
    auto bound = ast::bind_call(*call, generator.shape);
    if (!bound) {
        return;
    }
    auto size_node = bound->get(generator.size_parameter);
    const auto* size = size_node ? size_node->as<ast::Number>() : nullptr;
    if (size == nullptr) {
        return;
    }

    int score = m_config.score_or_default("crypto-gen-key", 0);
    if (size->value < m_config.min_key_size(generator.family)) {
        score = kMaxScore;
    }

    const auto location = context.location().string();
    const auto line = node->line_no();
    const std::string line_part = line.has_value() ? std::to_string(*line) : "unknown";

    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
    extra["function"] = *function;
    extra["key_type"] = generator.family;
    extra["key_size"] = size->value;

    context.report(Finding(Finding::Fields{
        .type = std::string(kFindingType),
        .location = location,
        .message = "Generation of cryptography key detected",
        .signature = make_signature({"crypto", "gen_key", location, line_part}),
        .score = score,
        .extra = std::move(extra),
        .line_no = line,
    }));
}

}  // namespace pkgaudit::rules
