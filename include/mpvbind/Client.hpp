// File: include/mpvbind/Client.hpp
// Purpose: Stable façade for the libmpv client wrapper.
// Key invariants: Re-exports supported client interfaces only.
// Ownership/Lifetime: Mirrors the underlying implementations.
// Links: docs/coverage.md
#pragma once

#include "client/Events.hpp"
#include "client/Mpv.hpp"
#include "client/MpvError.hpp"
#include "client/PropertyTraits.hpp"
#include "client/Protocol.hpp"

/// @file include/mpvbind/Client.hpp
/// @brief Aggregated public header for the libmpv client wrapper: the owning
///        handle, typed properties, events and custom stream protocols.
