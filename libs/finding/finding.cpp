/**
 * @file finding.cpp
 * @brief Finding construction and serialization
 */

#include "pkgaudit/finding.hpp"

#include <utility>

namespace pkgaudit {

Finding::Finding(Fields fields)
    : m_fields(std::move(fields))
{
    if (!m_fields.extra.is_object()) {
        m_fields.extra = nlohmann::ordered_json::object();
    }
}

nlohmann::ordered_json Finding::to_json() const
{
    nlohmann::ordered_json j = {
        {     "type",      m_fields.type},
        { "location",  m_fields.location},
        {  "message",   m_fields.message},
        {"signature", m_fields.signature},
        {    "score",     m_fields.score},
        {    "extra",     m_fields.extra}
    };
    if (m_fields.line_no.has_value()) {
        j["line_no"] = *m_fields.line_no;
    }
    return j;
}

std::string make_signature(std::initializer_list<std::string_view> parts)
{
    std::string signature;
    bool first = true;
    for (std::string_view part : parts) {
        if (!first) {
            signature += '#';
        }
        first = false;
        signature += part;
    }
    return signature;
}

}  // namespace pkgaudit
