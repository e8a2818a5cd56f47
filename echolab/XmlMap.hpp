/// @file
/// @brief Schema-driven mapping between records and pugixml element trees.
///
/// Each record type specializes SchemaOf<Rec>() with a table of fields:
///   - AttrField: logical name, raw attribute name, presence, codec;
///   - ChildField: one nested element, a run of sibling elements, or a
///     wrapper element holding a run of items.
/// Read<Rec>() and Dump() walk that table; nothing else knows attribute
/// names. Unknown attributes and elements are reported at Info and skipped.

#pragma once

#include "Codec.hpp"
#include "Diagnostics.hpp"
#include "Errors.hpp"

#include <pugixml.hpp>

#include <boost/preprocessor/stringize.hpp>

#include <gsl-lite/gsl-lite.hpp>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace echolab::xml {

namespace fs  = std::filesystem;
namespace gsl = ::gsl_lite;

using XmlNode = pugi::xml_node;
using XmlAttr = pugi::xml_attribute;

enum class Presence { Required, Optional };

template<class Rec>
struct AttrField {
  gsl::czstring name;   // logical name, also the table column name
  gsl::czstring attr;   // attribute name on the wire
  Presence presence = Presence::Required;
  ColumnType type = ColumnType::String;
  std::function<void(Rec&, std::string_view)> decode;
  std::function<std::optional<std::string>(const Rec&)> encode; // none: omit
  std::function<Cell(const Rec&)> cell;
}; // AttrField

template<class Rec>
struct ChildField {
  gsl::czstring name;
  gsl::czstring tag;
  std::function<void(Rec&, const XmlNode& parent, DiagnosticSink&)> read;
  std::function<void(const Rec&, XmlNode& parent)> dump;
}; // ChildField

template<class Rec>
struct Schema {
  gsl::czstring tag;
  std::vector<AttrField<Rec>>  attrs;
  std::vector<ChildField<Rec>> children;

  bool hasAttr(std::string_view raw) const noexcept {
    return std::ranges::any_of(attrs,
                    [raw](const AttrField<Rec>& f) { return raw == f.attr; });
  }
  bool hasChild(std::string_view tag_) const noexcept {
    return std::ranges::any_of(children,
                    [tag_](const ChildField<Rec>& f) { return tag_ == f.tag; });
  }
  const AttrField<Rec>* find(std::string_view name) const noexcept {
    auto it = std::ranges::find_if(attrs,
                    [name](const AttrField<Rec>& f) { return name == f.name; });
    return (it != attrs.end()) ? &*it : nullptr;
  }
}; // Schema

/// Specialized once per record type, next to the record.
template<class Rec> const Schema<Rec>& SchemaOf();

[[noreturn]] void InvalidAttr(const XmlNode& node, gsl::czstring key,
                              std::string_view reason);

void ReportIgnored(const XmlNode& node, DiagnosticSink& sink,
                   const std::function<bool(std::string_view)>& knownAttr,
                   const std::function<bool(std::string_view)>& knownChild);

// ---------- Field factories ----------

template<class Rec, class T, class C = Codec<T>>
AttrField<Rec> Attr(gsl::czstring name, gsl::czstring attr, T Rec::*member,
                    C = C{})
{
  static_assert(std::is_same_v<typename C::value_type, T>,
                "codec does not produce the member type");
  return AttrField<Rec>{
    name, attr, Presence::Required, C::Column,
    [member](Rec& r, std::string_view s) { r.*member = C::decode(s); },
    [member](const Rec& r) -> std::optional<std::string>
      { return C::encode(r.*member); },
    [member](const Rec& r) { return C::cell(r.*member); }
  };
} // Attr

template<class Rec, class T, class C = Codec<T>>
AttrField<Rec> OptAttr(gsl::czstring name, gsl::czstring attr,
                       std::optional<T> Rec::*member, C = C{})
{
  static_assert(std::is_same_v<typename C::value_type, T>,
                "codec does not produce the member type");
  return AttrField<Rec>{
    name, attr, Presence::Optional, C::Column,
    [member](Rec& r, std::string_view s) { r.*member = C::decode(s); },
    [member](const Rec& r) -> std::optional<std::string> {
      if (!(r.*member))
        return std::nullopt;
      return C::encode(*(r.*member));
    },
    [member](const Rec& r) -> Cell {
      if (!(r.*member))
        return Cell{};
      return C::cell(*(r.*member));
    }
  };
} // OptAttr

template<class Rec>
Rec Read(const XmlNode& node, DiagnosticSink& sink);

template<class Rec>
void Dump(XmlNode& node, const Rec& rec);

/// Exactly one nested element; the first is used if several are present.
template<class Rec, class T>
ChildField<Rec> Child(gsl::czstring name, T Rec::*member) {
  const auto tag = SchemaOf<T>().tag;
  return ChildField<Rec>{
    name, tag,
    [member, tag](Rec& r, const XmlNode& parent, DiagnosticSink& sink) {
      auto c = parent.child(tag);
      if (!c) {
        throw MissingRequiredField{parent.name(), tag,
                                   MissingRequiredField::Kind::Element};
      }
      if (c.next_sibling(tag)) {
        sink.warning("duplicate-element", std::string{"<"} + parent.name()
                     + ">: extra <" + tag + "> ignored");
      }
      r.*member = Read<T>(c, sink);
    },
    [member, tag](const Rec& r, XmlNode& parent) {
      auto c = parent.append_child(tag);
      Dump(c, r.*member);
    }
  };
} // Child

/// A run of sibling elements directly under the parent, in order.
template<class Rec, class T>
ChildField<Rec> List(gsl::czstring name, std::vector<T> Rec::*member) {
  const auto tag = SchemaOf<T>().tag;
  return ChildField<Rec>{
    name, tag,
    [member, tag](Rec& r, const XmlNode& parent, DiagnosticSink& sink) {
      auto& items = r.*member;
      items.clear();
      for (const auto& c: parent.children(tag))
        items.push_back(Read<T>(c, sink));
    },
    [member, tag](const Rec& r, XmlNode& parent) {
      for (const auto& item: r.*member) {
        auto c = parent.append_child(tag);
        Dump(c, item);
      }
    }
  };
} // List

/// <wrapper><item/>...</wrapper>. The wrapper is required, may be empty.
template<class Rec, class T>
ChildField<Rec> Wrapped(gsl::czstring name, gsl::czstring wrapper,
                        std::vector<T> Rec::*member)
{
  const auto tag = SchemaOf<T>().tag;
  return ChildField<Rec>{
    name, wrapper,
    [member, wrapper, tag](Rec& r, const XmlNode& parent,
                           DiagnosticSink& sink)
    {
      auto w = parent.child(wrapper);
      if (!w) {
        throw MissingRequiredField{parent.name(), wrapper,
                                   MissingRequiredField::Kind::Element};
      }
      ReportIgnored(w, sink,
                    [](std::string_view) { return false; },
                    [tag](std::string_view k) { return k == tag; });
      auto& items = r.*member;
      items.clear();
      for (const auto& c: w.children(tag))
        items.push_back(Read<T>(c, sink));
    },
    [member, wrapper, tag](const Rec& r, XmlNode& parent) {
      auto w = parent.append_child(wrapper);
      for (const auto& item: r.*member) {
        auto c = w.append_child(tag);
        Dump(c, item);
      }
    }
  };
} // Wrapped

// ---------- Engine ----------

template<class Rec>
void ReadInto(const XmlNode& node, const Schema<Rec>& schema, Rec& rec,
              DiagnosticSink& sink)
{
  for (const auto& f: schema.attrs) {
    const auto a = node.attribute(f.attr);
    if (!a) {
      if (f.presence == Presence::Required)
        throw MissingRequiredField{node.name(), f.attr};
      continue;
    }
    try {
      f.decode(rec, a.value());
    }
    catch (const CodecError& x) {
      InvalidAttr(node, f.attr, x.what());
    }
  }
  ReportIgnored(node, sink,
                [&schema](std::string_view k) { return schema.hasAttr(k); },
                [&schema](std::string_view k) { return schema.hasChild(k); });
  for (const auto& c: schema.children)
    c.read(rec, node, sink);
} // ReadInto

template<class Rec>
Rec Read(const XmlNode& node, DiagnosticSink& sink) {
  auto rec = Rec{};
  ReadInto(node, SchemaOf<Rec>(), rec, sink);
  return rec;
} // Read

template<class Rec>
void Dump(XmlNode& node, const Rec& rec) {
  const auto& schema = SchemaOf<Rec>();
  node.set_name(schema.tag);
  for (const auto& f: schema.attrs) {
    if (auto v = f.encode(rec))
      node.append_attribute(f.attr) = v->c_str();
  }
  for (const auto& c: schema.children)
    c.dump(rec, node);
} // Dump

// ---------- Documents ----------

/// @throws XmlSyntaxError
void LoadXml(pugi::xml_document& doc, std::string_view text);
void LoadXml(pugi::xml_document& doc, const fs::path& path);

std::string SaveXml(const pugi::xml_document& doc);
void SaveXml(const pugi::xml_document& doc, const fs::path& path);

/// The document element, which must carry the expected tag.
XmlNode RootElement(const pugi::xml_document& doc, gsl::czstring tag);

template<class Rec>
Rec ReadDocument(const pugi::xml_document& doc, DiagnosticSink& sink) {
  return Read<Rec>(RootElement(doc, SchemaOf<Rec>().tag), sink);
} // ReadDocument

template<class Rec>
void DumpDocument(pugi::xml_document& doc, const Rec& rec) {
  auto root = doc.append_child(SchemaOf<Rec>().tag);
  Dump(root, rec);
} // DumpDocument

} // echolab::xml

/// Attribute whose logical name is the member name.
#define ECHOLAB_ATTR(Rec, member, attr, ...) \
  ::echolab::xml::Attr(BOOST_PP_STRINGIZE(member), attr, &Rec::member \
                       __VA_OPT__(,) __VA_ARGS__)

#define ECHOLAB_OPT_ATTR(Rec, member, attr, ...) \
  ::echolab::xml::OptAttr(BOOST_PP_STRINGIZE(member), attr, &Rec::member \
                          __VA_OPT__(,) __VA_ARGS__)
