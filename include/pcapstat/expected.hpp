#pragma once

// PCAPSTAT Expected Type
//
// Exposes tl::expected in the pcapstat namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   pcapstat::expected<T, E> result = some_operation();
//   if (result.has_value()) {
//       process(*result);
//   } else {
//       handle(result.error());
//   }

#include <tl/expected.hpp>

namespace pcapstat {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace pcapstat
