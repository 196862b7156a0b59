/**
 * @file body_template.cpp
 * @brief Webhook body template rendering.
 */

#include "alerting/body_template.hpp"

#include <algorithm>
#include <array>

namespace container_pulse {

namespace {

constexpr std::array<TemplateKey, 6> kTemplateKeys{
    TemplateKey::Timestamp, TemplateKey::Alert,     TemplateKey::Resource,
    TemplateKey::CurrentValue, TemplateKey::Threshold, TemplateKey::Message};

constexpr std::string_view kOpen = "{{";
constexpr std::string_view kClose = "}}";

}  // anonymous namespace

std::optional<TemplateKey> parse_template_key(std::string_view name) noexcept {
    for (auto key : kTemplateKeys) {
        if (to_string(key) == name) return key;
    }
    return std::nullopt;
}

std::string template_value(TemplateKey key, const AlertEvent& event) {
    switch (key) {
        case TemplateKey::Timestamp:    return std::to_string(event.timestamp_ms);
        case TemplateKey::Alert:        return event.alert();
        case TemplateKey::Resource:     return std::string{to_string(event.resource)};
        case TemplateKey::CurrentValue: return format_number(event.current_value);
        case TemplateKey::Threshold:    return format_number(event.threshold);
        case TemplateKey::Message:      return event.message();
    }
    return {};
}

std::string render_body_template(std::string_view body_template, const AlertEvent& event) {
    std::string out;
    out.reserve(body_template.size());

    size_t pos = 0;
    while (pos < body_template.size()) {
        auto open = body_template.find(kOpen, pos);
        if (open == std::string_view::npos) break;

        auto close = body_template.find(kClose, open + kOpen.size());
        if (close == std::string_view::npos) break;

        out.append(body_template.substr(pos, open - pos));

        auto name = body_template.substr(open + kOpen.size(), close - open - kOpen.size());
        if (auto key = parse_template_key(name)) {
            out += template_value(*key, event);
            pos = close + kClose.size();
        } else {
            // Not a placeholder: emit one brace and rescan, so "{{{{message}}"
            // still finds the inner one.
            out.append(kOpen.substr(0, 1));
            pos = open + 1;
        }
    }
    out.append(body_template.substr(std::min(pos, body_template.size())));
    return out;
}

}  // namespace container_pulse
