/**
 * @file uid_policy.hpp
 * @brief Which process owners are visible to the enumerator.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <set>
#include <string_view>

namespace container_pulse {

/**
 * @brief Either "every UID passes" or an explicit set of visible UIDs.
 */
class UidAllowList {
public:
    /// No filtering.
    UidAllowList() = default;
    explicit UidAllowList(std::set<Uid> uids) : uids_(std::move(uids)) {}

    [[nodiscard]] bool unrestricted() const noexcept { return !uids_.has_value(); }

    /// An unreadable owner (empty uid) only passes when unrestricted.
    [[nodiscard]] bool allows(std::optional<Uid> uid) const {
        if (!uids_) return true;
        return uid.has_value() && uids_->contains(*uid);
    }

    [[nodiscard]] const std::optional<std::set<Uid>>& uids() const noexcept { return uids_; }

    bool operator==(const UidAllowList&) const = default;

private:
    std::optional<std::set<Uid>> uids_;
};

/// Leading-integer UID parse; empty when absent, negative or beyond Uid's range.
[[nodiscard]] std::optional<Uid> parse_uid(std::string_view text) noexcept;

/**
 * @brief Resolve the visibility policy. Pure; performs no I/O.
 *
 * - explicit_uids non-blank: the comma-separated UIDs it parses to, or
 *   { own_uid } when none parse.
 * - mode "user": { own_uid }
 * - mode "user+root": { own_uid, 0 }
 * - mode "all" or anything else: unrestricted.
 */
[[nodiscard]] UidAllowList build_uid_allow_list(std::string_view mode,
                                                std::string_view explicit_uids,
                                                Uid own_uid);

}  // namespace container_pulse
