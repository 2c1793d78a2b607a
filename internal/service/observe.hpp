#pragma once

#include <exception>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace heroes::service {

// Runs one RPC body inside a span and logs failures. Instruction metrics are
// recorded by the processor itself.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  heroes::observability::SpanScope span(route);
  try {
    return fn();
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    HEROES_LOG_ERROR("RPC failed", {heroes::observability::StringField("route", route), heroes::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace heroes::service
