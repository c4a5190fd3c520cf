//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: client/PropertyTraits.hpp
// Purpose: Map C++ value types onto libmpv data formats.
// Key invariants: Strings returned by libmpv are released with mpv_free exactly
//                 once, after they have been copied.
// Ownership/Lifetime: Native storage for set calls borrows from the caller's
//                     value and must not outlive the call.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <mpv/client.h>

namespace mpvbind::client
{

/// @brief Describes how a C++ type crosses the libmpv property API.
///
/// Each specialization provides:
///   - kFormat: the mpv_format passed to libmpv
///   - Native: storage whose address is handed to libmpv
///   - toNative(value): storage for set calls
///   - fromNative(native): value for get calls; takes ownership of any
///     libmpv allocation
template <class T> struct PropertyTraits;

template <> struct PropertyTraits<double>
{
    static constexpr mpv_format kFormat = MPV_FORMAT_DOUBLE;
    using Native = double;

    static Native toNative(double value)
    {
        return value;
    }

    static double fromNative(Native native)
    {
        return native;
    }
};

template <> struct PropertyTraits<int64_t>
{
    static constexpr mpv_format kFormat = MPV_FORMAT_INT64;
    using Native = int64_t;

    static Native toNative(int64_t value)
    {
        return value;
    }

    static int64_t fromNative(Native native)
    {
        return native;
    }
};

/// @brief mpv flags are C ints holding 0 or 1.
template <> struct PropertyTraits<bool>
{
    static constexpr mpv_format kFormat = MPV_FORMAT_FLAG;
    using Native = int;

    static Native toNative(bool value)
    {
        return value ? 1 : 0;
    }

    static bool fromNative(Native native)
    {
        return native != 0;
    }
};

template <> struct PropertyTraits<std::string>
{
    static constexpr mpv_format kFormat = MPV_FORMAT_STRING;
    using Native = char *;

    /// @note libmpv only reads through the pointer for set calls.
    static Native toNative(const std::string &value)
    {
        return const_cast<char *>(value.c_str());
    }

    static std::string fromNative(Native native)
    {
        std::string out = native ? native : "";
        mpv_free(native);
        return out;
    }
};

/// @brief Value carried by property-change and get-property-reply events.
/// @details std::monostate means the property is unavailable (MPV_FORMAT_NONE)
///          or was delivered in a format the wrapper does not convert.
using PropertyValue = std::variant<std::monostate, std::string, bool, int64_t, double>;

/// @brief Convert event property data of @p format at @p data.
/// @details Event data is owned by libmpv and is not freed here.
PropertyValue propertyValueFromEvent(mpv_format format, const void *data);

} // namespace mpvbind::client
