//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "coverage/ApiGroup.hpp"

namespace mpvbind::coverage
{

std::string_view apiGroupName(ApiGroup group)
{
    switch (group)
    {
        case ApiGroup::Lifecycle:
            return "lifecycle";
        case ApiGroup::Options:
            return "options";
        case ApiGroup::Commands:
            return "commands";
        case ApiGroup::Properties:
            return "properties";
        case ApiGroup::Events:
            return "events";
        case ApiGroup::Hooks:
            return "hooks";
        case ApiGroup::Rendering:
            return "rendering";
        case ApiGroup::Streaming:
            return "streaming";
    }
    return "";
}

std::optional<ApiGroup> parseApiGroup(std::string_view name)
{
    for (auto group : kApiGroups)
    {
        if (apiGroupName(group) == name)
            return group;
    }
    return std::nullopt;
}

} // namespace mpvbind::coverage
