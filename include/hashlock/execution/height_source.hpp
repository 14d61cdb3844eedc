#pragma once

#include <hashlock/schema/primitives.hpp>

#include <functional>

namespace hashlock::execution {

/// Reads the externally maintained height. Must never decrease between
/// calls; the engine samples it once per operation.
using height_source_t = std::function<hashlock::schema::height_t()>;

}  // namespace hashlock::execution
