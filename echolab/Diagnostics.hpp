/// @file
/// @brief Side channel for non-fatal conditions met while parsing.
///
/// Parse and validate entry points take a DiagnosticSink& and never write
/// to a stream directly. Only the top-level program picks the threshold.

#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace echolab {

enum class Severity { Debug, Info, Warning, Error };

const char* Name(Severity x) noexcept;

struct Diagnostic {
  Severity severity = Severity::Info;
  std::string code;     // e.g. "format-version"
  std::string message;
  bool operator==(const Diagnostic&) const = default;
}; // Diagnostic

class DiagnosticSink {
public:
  virtual ~DiagnosticSink() = default;
  virtual void report(const Diagnostic& d) = 0;
  void info(std::string code, std::string message)
    { report(Diagnostic{Severity::Info, std::move(code), std::move(message)}); }
  void warning(std::string code, std::string message) {
    report(Diagnostic{Severity::Warning, std::move(code), std::move(message)});
  }
}; // DiagnosticSink

class NullSink final: public DiagnosticSink {
public:
  void report(const Diagnostic&) override { }
}; // NullSink

/// Writes "<severity>: [<code>] <message>" lines at or above a threshold.
class StreamSink final: public DiagnosticSink {
  std::ostream* _os;
  Severity _threshold;
public:
  explicit StreamSink(std::ostream& os, Severity threshold = Severity::Warning)
    : _os{&os}, _threshold{threshold} { }
  Severity threshold() const noexcept { return _threshold; }
  void report(const Diagnostic& d) override;
}; // StreamSink

class CollectingSink final: public DiagnosticSink {
  std::vector<Diagnostic> _diagnostics;
public:
  void report(const Diagnostic& d) override { _diagnostics.push_back(d); }
  const std::vector<Diagnostic>& diagnostics() const noexcept
    { return _diagnostics; }
  bool contains(std::string_view code) const noexcept;
  void replay(DiagnosticSink& sink) const;
  void clear() noexcept { _diagnostics.clear(); }
}; // CollectingSink

/// StreamSink on std::cerr at Warning.
DiagnosticSink& DefaultSink();

} // echolab
