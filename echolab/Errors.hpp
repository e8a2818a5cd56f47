#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace echolab {

class Error: public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // Error

/// Raised by a scalar codec on text it cannot decode.
class CodecError: public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
}; // CodecError

class XmlSyntaxError: public Error {
public:
  using Error::Error;
}; // XmlSyntaxError

/// A required attribute (or child element) is absent.
class MissingRequiredField: public Error {
  std::string _tag;
  std::string _field;
public:
  enum class Kind { Attribute, Element };
  MissingRequiredField(std::string_view tag, std::string_view field,
                       Kind kind = Kind::Attribute);
  const std::string& tag()   const noexcept { return _tag;   }
  const std::string& field() const noexcept { return _field; }
}; // MissingRequiredField

/// An attribute is present but its text does not decode.
class InvalidValue: public Error {
  std::string _tag;
  std::string _field;
  std::string _value;
public:
  InvalidValue(std::string_view tag, std::string_view field,
               std::string_view value, std::string_view reason);
  const std::string& tag()   const noexcept { return _tag;   }
  const std::string& field() const noexcept { return _field; }
  const std::string& value() const noexcept { return _value; }
}; // InvalidValue

/// Neither labware variant matched. what() leads with the ELW failure.
class VariantMismatch: public Error {
  std::string _elwx;
  std::string _elw;
public:
  VariantMismatch(std::string elwx, std::string elw);
  const std::string& elwx() const noexcept { return _elwx; }
  const std::string& elw()  const noexcept { return _elw;  }
}; // VariantMismatch

class DuplicateKey: public Error {
  std::string _key;
public:
  explicit DuplicateKey(std::string_view key);
  const std::string& key() const noexcept { return _key; }
}; // DuplicateKey

class LookupMiss: public Error {
  std::string _key;
public:
  explicit LookupMiss(std::string_view key);
  const std::string& key() const noexcept { return _key; }
}; // LookupMiss

/// A cross-field invariant does not hold.
class SchemaViolation: public Error {
public:
  using Error::Error;
}; // SchemaViolation

} // echolab
