#include "Codec.hpp"
#include "Errors.hpp"

#include <charconv>
#include <format>
#include <limits>
#include <system_error>
#include <type_traits>
#include <cmath>

namespace echolab {

namespace {

template<typename T>
T ParseNumber(std::string_view s, const char* what) {
  auto v = T{};
  const auto* first = s.data();
  const auto* last  = s.data() + s.size();
  if constexpr (std::is_unsigned_v<T>) {
    if (!s.empty() && s.front() == '-')
      throw CodecError{std::format("negative value for {}: \"{}\"", what, s)};
  }
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec == std::errc::result_out_of_range)
    throw CodecError{std::format("{} out of range: \"{}\"", what, s)};
  if (ec != std::errc{} || ptr != last)
    throw CodecError{std::format("not a valid {}: \"{}\"", what, s)};
  return v;
} // ParseNumber

template<typename T>
std::string FormatNumber(T v) {
  char buf[64];
  const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{})
    throw CodecError{"number does not fit the output buffer"};
  return std::string{buf, ptr};
} // FormatNumber

} // local

const char* Name(ColumnType x) noexcept {
  switch (x) {
    case ColumnType::Int:       return "Int";
    case ColumnType::Float:     return "Float";
    case ColumnType::String:    return "String";
    case ColumnType::Timestamp: return "Timestamp";
    default: return nullptr;
  }
} // Name(ColumnType)

int Codec<int>::decode(std::string_view s)
  { return ParseNumber<int>(s, "integer"); }

std::string Codec<int>::encode(int v) { return FormatNumber(v); }

unsigned Codec<unsigned>::decode(std::string_view s)
  { return ParseNumber<unsigned>(s, "non-negative integer"); }

std::string Codec<unsigned>::encode(unsigned v) { return FormatNumber(v); }

double Codec<double>::decode(std::string_view s) {
  const auto v = ParseNumber<double>(s, "number");
  if (!std::isfinite(v))
    throw CodecError{std::format("not a finite number: \"{}\"", s)};
  return v;
} // Codec<double>::decode

std::string Codec<double>::encode(double v) {
  if (!std::isfinite(v))
    throw CodecError{"cannot encode a non-finite number"};
  return FormatNumber(v);
} // Codec<double>::encode

BarcodeCodec::value_type BarcodeCodec::decode(std::string_view s) {
  if (s == Sentinel)
    return std::nullopt;
  return std::string{s};
} // BarcodeCodec::decode

std::string BarcodeCodec::encode(const value_type& v)
  { return v ? *v : std::string{Sentinel}; }

Cell BarcodeCodec::cell(const value_type& v) {
  if (!v)
    return Cell{};
  return *v;
} // BarcodeCodec::cell

ZeroNullCodec::value_type ZeroNullCodec::decode(std::string_view s) {
  const auto v = Codec<double>::decode(s);
  if (v == 0.0)
    return std::nullopt;
  return v;
} // ZeroNullCodec::decode

std::string ZeroNullCodec::encode(const value_type& v)
  { return v ? Codec<double>::encode(*v) : std::string{"0"}; }

Cell ZeroNullCodec::cell(const value_type& v) {
  if (!v)
    return Cell{};
  return *v;
} // ZeroNullCodec::cell

std::string ToString(const Cell& c) {
  struct Visitor {
    std::string operator()(std::monostate) const { return {}; }
    std::string operator()(std::int64_t v) const { return FormatNumber(v); }
    std::string operator()(double v) const { return FormatNumber(v); }
    std::string operator()(const std::string& v) const { return v; }
    std::string operator()(const Timestamp& v) const { return v.str(); }
  };
  return std::visit(Visitor{}, c);
} // ToString(Cell)

} // echolab
