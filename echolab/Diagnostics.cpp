#include "Diagnostics.hpp"

#include <algorithm>
#include <iostream>
#include <string_view>

namespace echolab {

const char* Name(Severity x) noexcept {
  switch (x) {
    case Severity::Debug:   return "debug";
    case Severity::Info:    return "info";
    case Severity::Warning: return "warning";
    case Severity::Error:   return "error";
    default: return nullptr;
  }
} // Name(Severity)

void StreamSink::report(const Diagnostic& d) {
  if (d.severity < _threshold)
    return;
  *_os << Name(d.severity) << ": [" << d.code << "] " << d.message << '\n';
} // StreamSink::report

bool CollectingSink::contains(std::string_view code) const noexcept {
  return std::ranges::any_of(_diagnostics,
                    [code](const Diagnostic& d) { return d.code == code; });
} // CollectingSink::contains

void CollectingSink::replay(DiagnosticSink& sink) const {
  for (const auto& d: _diagnostics)
    sink.report(d);
} // CollectingSink::replay

DiagnosticSink& DefaultSink() {
  static auto sink = StreamSink{std::cerr, Severity::Warning};
  return sink;
} // DefaultSink

} // echolab
