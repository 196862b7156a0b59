/**
 * @file uid_policy.cpp
 * @brief UID visibility policy resolution.
 */

#include "sampler/uid_policy.hpp"

#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace container_pulse {

std::optional<Uid> parse_uid(std::string_view text) noexcept {
    auto value = parse_leading_int(text);
    if (!value || *value < 0 || *value > std::numeric_limits<Uid>::max()) return std::nullopt;
    return static_cast<Uid>(*value);
}

UidAllowList build_uid_allow_list(std::string_view mode,
                                  std::string_view explicit_uids,
                                  Uid own_uid) {
    explicit_uids = trim(explicit_uids);
    if (!explicit_uids.empty()) {
        std::set<Uid> uids;
        while (!explicit_uids.empty()) {
            auto comma = explicit_uids.find(',');
            auto part = explicit_uids.substr(0, comma);
            if (auto uid = parse_uid(part)) {
                uids.insert(*uid);
            }
            if (comma == std::string_view::npos) break;
            explicit_uids.remove_prefix(comma + 1);
        }
        if (uids.empty()) uids.insert(own_uid);
        return UidAllowList{std::move(uids)};
    }

    std::string normalized{trim(mode)};
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "user") return UidAllowList{std::set<Uid>{own_uid}};
    if (normalized == "user+root") return UidAllowList{std::set<Uid>{own_uid, 0}};
    return UidAllowList{};
}

}  // namespace container_pulse
