/// @file
/// @brief Scalar codecs: attribute text <-> typed value <-> table cell.
///
/// A codec is a stateless struct with
///   value_type, Column,
///   decode(std::string_view) -> value_type   (throws CodecError)
///   encode(const value_type&) -> std::string
///   cell(const value_type&) -> Cell
/// The XML mapping engine binds a codec to a data member; it never looks at
/// the text itself.

#pragma once

#include "Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace echolab {

enum class ColumnType { Int, Float, String, Timestamp };

const char* Name(ColumnType x) noexcept;

/// One table cell. monostate is null.
using Cell = std::variant<std::monostate, std::int64_t, double, std::string,
                          Timestamp>;

template<typename T> struct Codec;

template<>
struct Codec<std::string> {
  using value_type = std::string;
  static constexpr auto Column = ColumnType::String;
  static std::string decode(std::string_view s) { return std::string{s}; }
  static std::string encode(const std::string& v) { return v; }
  static Cell cell(const std::string& v) { return v; }
}; // Codec<std::string>

template<>
struct Codec<int> {
  using value_type = int;
  static constexpr auto Column = ColumnType::Int;
  static int decode(std::string_view s);
  static std::string encode(int v);
  static Cell cell(int v) { return std::int64_t{v}; }
}; // Codec<int>

/// Non-negative integers; "-1" is rejected rather than wrapped.
template<>
struct Codec<unsigned> {
  using value_type = unsigned;
  static constexpr auto Column = ColumnType::Int;
  static unsigned decode(std::string_view s);
  static std::string encode(unsigned v);
  static Cell cell(unsigned v) { return std::int64_t{v}; }
}; // Codec<unsigned>

/// Finite doubles, written in the shortest form that reads back exactly.
template<>
struct Codec<double> {
  using value_type = double;
  static constexpr auto Column = ColumnType::Float;
  static double decode(std::string_view s);
  static std::string encode(double v);
  static Cell cell(double v) { return v; }
}; // Codec<double>

template<>
struct Codec<Timestamp> {
  using value_type = Timestamp;
  static constexpr auto Column = ColumnType::Timestamp;
  static Timestamp decode(std::string_view s) { return Timestamp::Parse(s); }
  static std::string encode(const Timestamp& v) { return v.str(); }
  static Cell cell(const Timestamp& v) { return v; }
}; // Codec<Timestamp>

/// The survey writes "UnknownBarCode" for an unlabelled plate. A plate
/// really labelled "UnknownBarCode" reads back as unlabelled.
struct BarcodeCodec {
  using value_type = std::optional<std::string>;
  static constexpr auto Column = ColumnType::String;
  static constexpr char Sentinel[] = "UnknownBarCode";
  static value_type decode(std::string_view s);
  static std::string encode(const value_type& v);
  static Cell cell(const value_type& v);
}; // BarcodeCodec

/// Volumes use 0 for "not measured". A true zero reads back as absent.
struct ZeroNullCodec {
  using value_type = std::optional<double>;
  static constexpr auto Column = ColumnType::Float;
  static value_type decode(std::string_view s);
  static std::string encode(const value_type& v);
  static Cell cell(const value_type& v);
}; // ZeroNullCodec

std::string ToString(const Cell& c);

} // echolab
