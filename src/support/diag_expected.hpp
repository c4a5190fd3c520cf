//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Expected<T>, the result type of every fallible operation, plus the
//          diagnostic constructors and the single diagnostic printer.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mpvbind::support
{

using Diag = Diagnostic;

/// @brief Value of type @p T or the diagnostic explaining why there is none.
/// @details Converts implicitly from either alternative so functions can
///          `return value;` or `return makeError(...);`.  Accessing the wrong
///          alternative is a programming error and throws
///          std::bad_variant_access.
template <class T> class Expected
{
    static_assert(!std::is_same_v<T, Diag>, "Expected<Diag> is ambiguous");

  public:
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    T &value()
    {
        return std::get<0>(state_);
    }

    const T &value() const
    {
        return std::get<0>(state_);
    }

    const Diag &error() const &
    {
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Diag> state_;
};

/// @brief Success carries nothing; failure carries the diagnostic.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : error_(std::move(diag)), failed_(true) {}

    [[nodiscard]] bool hasValue() const
    {
        return !failed_;
    }

    explicit operator bool() const
    {
        return !failed_;
    }

    /// @brief Diagnostic of a failed result; a default Diag on success.
    const Diag &error() const &
    {
        return error_;
    }

  private:
    Diag error_{Severity::Error, {}, {}, 0};
    bool failed_ = false;
};

/// @brief Error diagnostic at @p loc; @p code is the subsystem status if any.
Diag makeError(SourceLoc loc, std::string msg, int code = 0);

/// @brief Warning diagnostic at @p loc.
Diag makeWarning(SourceLoc loc, std::string msg);

/// @brief Print @p diag as one line, followed by a quoted source line.
///
/// @details The line reads "path:line:col: severity: message [code]".  The
///          location prefix shrinks to "line N: " when @p sm does not know the
///          file and disappears when no line is known; " [code]" appears only
///          for a non-zero code.  When @p sm holds the file's text, the line
///          at the location is printed next with a caret under the column.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace mpvbind::support
