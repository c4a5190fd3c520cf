//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: coverage/ApiGroup.hpp
// Purpose: Enumerates the logical sections of the libmpv client API.
// Key invariants: Enumerator order is the rendering order of the checklist.
// Ownership/Lifetime: Value types and static strings only.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace mpvbind::coverage
{

/// @brief Logical section of the libmpv API a symbol belongs to.
enum class ApiGroup : std::size_t
{
    Lifecycle,
    Options,
    Commands,
    Properties,
    Events,
    Hooks,
    Rendering,
    Streaming,
};

inline constexpr std::size_t kApiGroupCount = static_cast<std::size_t>(ApiGroup::Streaming) + 1;

/// @brief All groups in checklist order.
inline constexpr std::array<ApiGroup, kApiGroupCount> kApiGroups = {
    ApiGroup::Lifecycle,
    ApiGroup::Options,
    ApiGroup::Commands,
    ApiGroup::Properties,
    ApiGroup::Events,
    ApiGroup::Hooks,
    ApiGroup::Rendering,
    ApiGroup::Streaming,
};

/// @brief Lowercase display name, e.g. "lifecycle".
std::string_view apiGroupName(ApiGroup group);

/// @brief Inverse of apiGroupName(); std::nullopt for unknown names.
std::optional<ApiGroup> parseApiGroup(std::string_view name);

/// @brief Position of @p group in kApiGroups.
constexpr std::size_t apiGroupIndex(ApiGroup group)
{
    return static_cast<std::size_t>(group);
}

} // namespace mpvbind::coverage
