/**
 * @file body_template.hpp
 * @brief {{placeholder}} substitution for webhook bodies.
 *
 * Only the keys of TemplateKey are recognized. Anything else between
 * double braces, including malformed or unknown placeholders, is copied
 * through verbatim. Values are substituted raw (no JSON escaping), so a
 * template author quotes string placeholders themselves.
 */

#pragma once

#include "alerting/threshold_evaluator.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace container_pulse {

enum class TemplateKey : uint8_t {
    Timestamp,
    Alert,
    Resource,
    CurrentValue,
    Threshold,
    Message
};

/// Placeholder name as written between the braces, e.g. "currentValue".
[[nodiscard]] constexpr std::string_view to_string(TemplateKey key) noexcept {
    switch (key) {
        case TemplateKey::Timestamp:    return "timestamp";
        case TemplateKey::Alert:        return "alert";
        case TemplateKey::Resource:     return "resource";
        case TemplateKey::CurrentValue: return "currentValue";
        case TemplateKey::Threshold:    return "threshold";
        case TemplateKey::Message:      return "message";
    }
    return "";
}

[[nodiscard]] std::optional<TemplateKey> parse_template_key(std::string_view name) noexcept;

/// Value a placeholder expands to for the given event.
[[nodiscard]] std::string template_value(TemplateKey key, const AlertEvent& event);

[[nodiscard]] std::string render_body_template(std::string_view body_template,
                                               const AlertEvent& event);

}  // namespace container_pulse
