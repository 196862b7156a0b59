/**
 * @file types.cpp
 * @brief Out-of-line helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <cctype>
#include <chrono>

namespace container_pulse {

std::optional<HttpMethod> parse_http_method(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "GET")   return HttpMethod::Get;
    if (upper == "POST")  return HttpMethod::Post;
    if (upper == "PUT")   return HttpMethod::Put;
    if (upper == "PATCH") return HttpMethod::Patch;
    return std::nullopt;
}

TimestampMs now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace container_pulse
