/// @file
/// @brief ISO-8601 date-time as written in survey "date" attributes.
///
/// The instrument writes local wall-clock time, sometimes with a UTC
/// offset and a 7-digit fraction. A Timestamp remembers how it was spelled
/// so that Parse(s).str() == s for every string Parse accepts.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace echolab {

class Timestamp {
public:
  using Duration  = std::chrono::nanoseconds;
  using LocalTime = std::chrono::local_time<Duration>;
  using SysTime   = std::chrono::sys_time<Duration>;
  enum class Zone { None, Utc, Offset };

private:
  LocalTime _local{};
  std::chrono::minutes _offset{0};
  Zone _zone = Zone::None;
  char _separator = 'T';
  bool _seconds = true;
  bool _offsetColon = true;
  int _digits = 0;

public:
  Timestamp() = default;
  explicit Timestamp(LocalTime local, Zone zone = Zone::None,
                     std::chrono::minutes offset = std::chrono::minutes{0});

  /// @throws CodecError on malformed text or an impossible calendar date.
  static Timestamp Parse(std::string_view text);

  std::string str() const;

  LocalTime local() const noexcept { return _local; }
  Zone zone() const noexcept { return _zone; }
  std::optional<std::chrono::minutes> offset() const noexcept;
  int fractionDigits() const noexcept { return _digits; }

  /// Instant in UTC; a timestamp without zone is taken to be UTC.
  SysTime utc() const noexcept
    { return SysTime{_local.time_since_epoch()} - _offset; }

  bool operator==(const Timestamp&) const = default;
}; // Timestamp

} // echolab
