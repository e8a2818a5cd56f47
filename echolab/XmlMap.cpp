#include "XmlMap.hpp"

#include <format>
#include <sstream>
#include <string>

namespace echolab::xml {

[[noreturn]] void InvalidAttr(const XmlNode& node, gsl::czstring key,
                              std::string_view reason)
{
  const auto a = node.attribute(key);
  throw InvalidValue{node.name(), key, a ? a.value() : "", reason};
} // InvalidAttr

void ReportIgnored(const XmlNode& node, DiagnosticSink& sink,
                   const std::function<bool(std::string_view)>& knownAttr,
                   const std::function<bool(std::string_view)>& knownChild)
{
  for (const auto& a: node.attributes()) {
    if (knownAttr(a.name()))
      continue;
    sink.info("ignored-attribute",
              std::format("<{}>: attribute ignored: {}", node.name(),
                          a.name()));
  }
  for (const auto& c: node.children()) {
    if (c.type() != pugi::node_element)
      continue;
    if (knownChild(c.name()))
      continue;
    sink.info("ignored-element",
              std::format("<{}>: element ignored: {}", node.name(),
                          c.name()));
  }
} // ReportIgnored

void LoadXml(pugi::xml_document& doc, std::string_view text) {
  const auto res = doc.load_buffer(text.data(), text.size());
  if (!res) {
    throw XmlSyntaxError{std::format("XML parse error: {} (offset {})",
                                     res.description(), res.offset)};
  }
} // LoadXml(text)

void LoadXml(pugi::xml_document& doc, const fs::path& path) {
  const auto path_str = path.string();
  const auto res = doc.load_file(path_str.c_str());
  if (!res) {
    throw XmlSyntaxError{std::format("XML parse error for '{}': {} (offset {})",
                                     path_str, res.description(), res.offset)};
  }
} // LoadXml(path)

std::string SaveXml(const pugi::xml_document& doc) {
  auto os = std::ostringstream{};
  doc.save(os, "  ");
  return os.str();
} // SaveXml(string)

void SaveXml(const pugi::xml_document& doc, const fs::path& path) {
  const auto path_str = path.string();
  if (!doc.save_file(path_str.c_str(), "  "))
    throw Error{"Error writing '" + path_str + "'"};
} // SaveXml(path)

XmlNode RootElement(const pugi::xml_document& doc, gsl::czstring tag) {
  const auto root = doc.document_element();
  if (!root || std::string_view{root.name()} != tag) {
    throw MissingRequiredField{"document", tag,
                               MissingRequiredField::Kind::Element};
  }
  return root;
} // RootElement

} // echolab::xml
