#pragma once

// UNIXTS Expected Type
//
// Exposes tl::expected in the unixts namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility. Both alternatives stay literal types
// for every error this library reports, so results can be inspected inside
// constant expressions.
//
// Usage:
//   unixts::expected<T, E> result = some_operation();
//   if (result.has_value()) {
//       process(*result);
//   } else {
//       handle(result.error());
//   }

#include <tl/expected.hpp>

namespace unixts {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace unixts
