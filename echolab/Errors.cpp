#include "Errors.hpp"

#include <format>
#include <string>
#include <utility>

namespace echolab {

namespace {

std::string MissingMessage(std::string_view tag, std::string_view field,
                           MissingRequiredField::Kind kind)
{
  if (kind == MissingRequiredField::Kind::Element)
    return std::format("missing required element <{}> in <{}>", field, tag);
  return std::format("missing required attribute \"{}\" on <{}>", field, tag);
} // MissingMessage

} // local

MissingRequiredField::MissingRequiredField(std::string_view tag,
                                           std::string_view field, Kind kind)
  : Error{MissingMessage(tag, field, kind)}
  , _tag{tag}
  , _field{field}
  { }

InvalidValue::InvalidValue(std::string_view tag, std::string_view field,
                           std::string_view value, std::string_view reason)
  : Error{std::format("invalid attribute \"{}\" = \"{}\" on <{}>: {}",
                      field, value, tag, reason)}
  , _tag{tag}
  , _field{field}
  , _value{value}
  { }

VariantMismatch::VariantMismatch(std::string elwx, std::string elw)
  : Error{std::format("not a recognized labware document: {}"
                      " (as ELWX: {})", elw, elwx)}
  , _elwx{std::move(elwx)}
  , _elw{std::move(elw)}
  { }

DuplicateKey::DuplicateKey(std::string_view key)
  : Error{std::format("plate of type \"{}\" already exists", key)}
  , _key{key}
  { }

LookupMiss::LookupMiss(std::string_view key)
  : Error{std::format("no entry named \"{}\"", key)}
  , _key{key}
  { }

} // echolab
