#include "Timestamp.hpp"
#include "Errors.hpp"

#include <format>
#include <string>
#include <string_view>
#include <cstdint>
#include <cctype>

namespace echolab {

using namespace std::chrono;

namespace {

constexpr std::int64_t Pow10(int n) noexcept {
  auto p = std::int64_t{1};
  while (n-- > 0)
    p *= 10;
  return p;
} // Pow10

class Scanner {
  std::string_view _text;
  std::size_t _pos = 0;

public:
  explicit Scanner(std::string_view text) : _text{text} { }

  [[noreturn]] void fail(std::string_view what) const {
    throw CodecError{std::format("invalid timestamp \"{}\": {}", _text, what)};
  }

  bool done() const noexcept { return _pos == _text.size(); }

  bool accept(char c) noexcept {
    if (done() || _text[_pos] != c)
      return false;
    ++_pos;
    return true;
  }

  void expect(char c, std::string_view what) {
    if (!accept(c))
      fail(what);
  }

  bool atSign() const noexcept
    { return !done() && (_text[_pos] == '+' || _text[_pos] == '-'); }

  int number(int width, std::string_view what) {
    if (_pos + static_cast<std::size_t>(width) > _text.size())
      fail(what);
    auto v = 0;
    for (auto i = 0; i != width; ++i) {
      const auto c = static_cast<unsigned char>(_text[_pos + i]);
      if (!std::isdigit(c))
        fail(what);
      v = v * 10 + (c - '0');
    }
    _pos += width;
    return v;
  } // number

  // Up to nine digits, scaled to nanoseconds.
  std::int64_t fraction(int& digits) {
    auto v = std::int64_t{0};
    digits = 0;
    while (!done() && std::isdigit(static_cast<unsigned char>(_text[_pos]))) {
      if (++digits > 9)
        fail("fraction longer than nine digits");
      v = v * 10 + (_text[_pos++] - '0');
    }
    if (digits == 0)
      fail("empty fraction");
    return v * Pow10(9 - digits);
  } // fraction
}; // Scanner

int MinimalDigits(nanoseconds sub) noexcept {
  const auto ns = sub.count();
  if (ns == 0)             return 0;
  if (ns % 1'000'000 == 0) return 3;
  if (ns % 1'000 == 0)     return 6;
  return 9;
} // MinimalDigits

} // local

Timestamp::Timestamp(LocalTime local, Zone zone, minutes offset)
  : _local{local}
  , _offset{zone == Zone::Offset ? offset : minutes{0}}
  , _zone{zone}
{
  const auto date = floor<days>(_local);
  _digits = MinimalDigits(hh_mm_ss{_local - date}.subseconds());
} // Timestamp ctor

Timestamp Timestamp::Parse(std::string_view text) {
  auto in = Scanner{text};
  auto ts = Timestamp{};

  const auto y  = in.number(4, "bad year");
  in.expect('-', "expected '-' after year");
  const auto mo = in.number(2, "bad month");
  in.expect('-', "expected '-' after month");
  const auto d  = in.number(2, "bad day");
  if (in.accept('T'))
    ts._separator = 'T';
  else if (in.accept(' '))
    ts._separator = ' ';
  else
    in.fail("missing time of day");

  const auto h  = in.number(2, "bad hour");
  in.expect(':', "expected ':' after hour");
  const auto mi = in.number(2, "bad minute");
  auto s  = 0;
  auto ns = std::int64_t{0};
  ts._seconds = in.accept(':');
  if (ts._seconds) {
    s = in.number(2, "bad second");
    if (in.accept('.'))
      ns = in.fraction(ts._digits);
  }

  if (in.accept('Z')) {
    ts._zone = Zone::Utc;
  }
  else if (in.atSign()) {
    const auto negative = in.accept('-');
    if (!negative)
      in.expect('+', "bad offset sign");
    const auto oh = in.number(2, "bad offset hours");
    ts._offsetColon = in.accept(':');
    const auto om = in.number(2, "bad offset minutes");
    if (oh > 23 || om > 59)
      in.fail("offset out of range");
    ts._zone = Zone::Offset;
    ts._offset = hours{oh} + minutes{om};
    if (negative)
      ts._offset = -ts._offset;
  }
  if (!in.done())
    in.fail("trailing characters");

  const auto ymd = year{y} / month{static_cast<unsigned>(mo)}
                           / day{static_cast<unsigned>(d)};
  if (!ymd.ok())
    in.fail("no such calendar date");
  if (h > 23 || mi > 59 || s > 59)
    in.fail("time of day out of range");

  ts._local = LocalTime{local_days{ymd}.time_since_epoch()}
            + hours{h} + minutes{mi} + seconds{s} + nanoseconds{ns};
  return ts;
} // Timestamp::Parse

std::string Timestamp::str() const {
  const auto date = floor<days>(_local);
  const auto ymd = year_month_day{date};
  const auto tod = hh_mm_ss{_local - date};

  auto out = std::format("{:04}-{:02}-{:02}{}{:02}:{:02}",
                         static_cast<int>(ymd.year()),
                         static_cast<unsigned>(ymd.month()),
                         static_cast<unsigned>(ymd.day()),
                         _separator,
                         tod.hours().count(), tod.minutes().count());
  if (_seconds) {
    out += std::format(":{:02}", tod.seconds().count());
    if (_digits > 0) {
      const auto frac = tod.subseconds().count() / Pow10(9 - _digits);
      out += std::format(".{:0{}}", frac, _digits);
    }
  }

  switch (_zone) {
    case Zone::None:
      break;
    case Zone::Utc:
      out += 'Z';
      break;
    case Zone::Offset: {
      const auto total = _offset.count();
      const auto mag = total < 0 ? -total : total;
      out += std::format("{}{:02}{}{:02}", total < 0 ? '-' : '+', mag / 60,
                         _offsetColon ? ":" : "", mag % 60);
      break;
    }
  }
  return out;
} // Timestamp::str

std::optional<std::chrono::minutes> Timestamp::offset() const noexcept {
  if (_zone == Zone::None)
    return std::nullopt;
  return _offset;
} // Timestamp::offset

} // echolab
