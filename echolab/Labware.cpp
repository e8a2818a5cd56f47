#include "Labware.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <expected>
#include <format>
#include <type_traits>

namespace echolab {

const char* Name(Usage x) noexcept {
  switch (x) {
    case Usage::Source:      return "SRC";
    case Usage::Destination: return "DEST";
    default: return "";
  }
} // Name(Usage)

Usage Codec<Usage>::decode(std::string_view s) {
  if (s == "SRC")
    return Usage::Source;
  if (s == "DEST")
    return Usage::Destination;
  throw CodecError{std::format("unknown usage \"{}\" (expected SRC or DEST)",
                               s)};
} // Codec<Usage>::decode

PlateInfo ElwPlate::info(Usage usage_) const {
  return PlateInfo{
    .platetype      = platetype,
    .plateformat    = std::string{plateformat()},
    .usage          = usage_,
    .fluid          = fluid,
    .manufacturer   = manufacturer,
    .lotnumber      = lotnumber,
    .partnumber     = partnumber,
    .rows           = rows,
    .cols           = cols,
    .a1offsety      = a1offsety,
    .centerspacingx = centerspacingx,
    .centerspacingy = centerspacingy,
    .plateheight    = plateheight,
    .skirtheight    = skirtheight,
    .wellwidth      = wellwidth,
    .welllength     = welllength(),
    .wellcapacity   = wellcapacity,
    .bottominset    = bottominset,
    .centerwellposx = centerwellposx,
    .centerwellposy = centerwellposy,
    .minwellvol     = minwellvol,
    .maxwellvol     = maxwellvol,
    .maxvoltotal    = maxvoltotal,
    .minvolume      = minvolume,
    .dropvolume     = dropvolume
  };
} // ElwPlate::info

} // echolab

namespace echolab::xml {

namespace {

// ELW plates leave out plateformat, usage and welllength.
template<class Rec>
std::vector<AttrField<Rec>> PlateAttrs() {
  constexpr auto elwx = std::is_same_v<Rec, PlateInfo>;
  auto v = std::vector<AttrField<Rec>>{};
  v.push_back(ECHOLAB_ATTR(Rec, platetype, "platetype"));
  if constexpr (elwx) {
    v.push_back(ECHOLAB_ATTR(Rec, plateformat, "plateformat"));
    v.push_back(ECHOLAB_ATTR(Rec, usage, "usage"));
  }
  v.push_back(ECHOLAB_OPT_ATTR(Rec, fluid, "fluid"));
  v.push_back(ECHOLAB_ATTR(Rec, manufacturer,   "manufacturer"));
  v.push_back(ECHOLAB_ATTR(Rec, lotnumber,      "lotnumber"));
  v.push_back(ECHOLAB_ATTR(Rec, partnumber,     "partnumber"));
  v.push_back(ECHOLAB_ATTR(Rec, rows,           "rows"));
  v.push_back(ECHOLAB_ATTR(Rec, cols,           "cols"));
  v.push_back(ECHOLAB_ATTR(Rec, a1offsety,      "a1offsety"));
  v.push_back(ECHOLAB_ATTR(Rec, centerspacingx, "centerspacingx"));
  v.push_back(ECHOLAB_ATTR(Rec, centerspacingy, "centerspacingy"));
  v.push_back(ECHOLAB_ATTR(Rec, plateheight,    "plateheight"));
  v.push_back(ECHOLAB_ATTR(Rec, skirtheight,    "skirtheight"));
  v.push_back(ECHOLAB_ATTR(Rec, wellwidth,      "wellwidth"));
  if constexpr (elwx)
    v.push_back(ECHOLAB_ATTR(Rec, welllength,   "welllength"));
  v.push_back(ECHOLAB_ATTR(Rec, wellcapacity,   "wellcapacity"));
  v.push_back(ECHOLAB_ATTR(Rec, bottominset,    "bottominset"));
  v.push_back(ECHOLAB_ATTR(Rec, centerwellposx, "centerwellposx"));
  v.push_back(ECHOLAB_ATTR(Rec, centerwellposy, "centerwellposy"));
  v.push_back(ECHOLAB_OPT_ATTR(Rec, minwellvol,  "minwellvol"));
  v.push_back(ECHOLAB_OPT_ATTR(Rec, maxwellvol,  "maxwellvol"));
  v.push_back(ECHOLAB_OPT_ATTR(Rec, maxvoltotal, "maxvoltotal"));
  v.push_back(ECHOLAB_OPT_ATTR(Rec, minvolume,   "minvolume"));
  v.push_back(ECHOLAB_OPT_ATTR(Rec, dropvolume,  "dropvolume"));
  return v;
} // PlateAttrs

template<class Plate>
Schema<LabwareXml<Plate>> DocumentSchema() {
  using Doc = LabwareXml<Plate>;
  return Schema<Doc>{
    "EchoLabware",
    {},
    {
      Wrapped("sourceplates", "sourceplates", &Doc::sourceplates),
      Wrapped("destinationplates", "destinationplates",
              &Doc::destinationplates)
    }
  };
} // DocumentSchema

} // local

template<>
const Schema<PlateInfo>& SchemaOf<PlateInfo>() {
  static const auto schema =
      Schema<PlateInfo>{"plateinfo", PlateAttrs<PlateInfo>(), {}};
  return schema;
} // SchemaOf<PlateInfo>

template<>
const Schema<ElwPlate>& SchemaOf<ElwPlate>() {
  static const auto schema =
      Schema<ElwPlate>{"plateinfo", PlateAttrs<ElwPlate>(), {}};
  return schema;
} // SchemaOf<ElwPlate>

template<>
const Schema<ElwxDocument>& SchemaOf<ElwxDocument>() {
  static const auto schema = DocumentSchema<PlateInfo>();
  return schema;
} // SchemaOf<ElwxDocument>

template<>
const Schema<ElwDocument>& SchemaOf<ElwDocument>() {
  static const auto schema = DocumentSchema<ElwPlate>();
  return schema;
} // SchemaOf<ElwDocument>

} // echolab::xml

namespace echolab {

namespace {

template<class Plate>
std::expected<LabwareXml<Plate>, std::string>
TryRead(const pugi::xml_document& doc, DiagnosticSink& sink) {
  try {
    return xml::ReadDocument<LabwareXml<Plate>>(doc, sink);
  }
  catch (const Error& x) {
    return std::unexpected{std::string{x.what()}};
  }
} // TryRead

} // local

Labware::Labware(Plates plates) {
  _plates.reserve(plates.size());
  for (auto& p: plates)
    add(std::move(p));
} // Labware::ctor

Labware::Labware(const ElwxDocument& raw) {
  _plates.reserve(raw.sourceplates.size() + raw.destinationplates.size());
  for (const auto& p: raw.sourceplates)
    add(p);
  for (const auto& p: raw.destinationplates)
    add(p);
} // Labware::ctor(ELWX)

Labware::Labware(const ElwDocument& raw) {
  _plates.reserve(raw.sourceplates.size() + raw.destinationplates.size());
  for (const auto& p: raw.sourceplates)
    add(p.info(Usage::Source));
  for (const auto& p: raw.destinationplates)
    add(p.info(Usage::Destination));
} // Labware::ctor(ELW)

Labware Labware::FromDocument(const pugi::xml_document& doc,
                              DiagnosticSink& sink)
{
  auto elwxLog = CollectingSink{};
  auto elwx = TryRead<PlateInfo>(doc, elwxLog);
  if (elwx) {
    elwxLog.replay(sink);
    return Labware{*elwx};
  }
  auto elwLog = CollectingSink{};
  auto elw = TryRead<ElwPlate>(doc, elwLog);
  if (elw) {
    sink.info("labware-variant",
              std::format("read as ELW after ELWX failed: {}", elwx.error()));
    elwLog.replay(sink);
    return Labware{*elw};
  }
  throw VariantMismatch{std::move(elwx.error()), std::move(elw.error())};
} // Labware::FromDocument

Labware Labware::FromString(std::string_view text, DiagnosticSink& sink) {
  auto doc = pugi::xml_document{};
  xml::LoadXml(doc, text);
  return FromDocument(doc, sink);
} // Labware::FromString

Labware Labware::Read(const fs::path& path, DiagnosticSink& sink) {
  auto doc = pugi::xml_document{};
  xml::LoadXml(doc, path);
  return FromDocument(doc, sink);
} // Labware::Read

ElwxDocument Labware::elwx() const {
  auto raw = ElwxDocument{};
  for (const auto& p: _plates) {
    if (p.usage == Usage::Source)
      raw.sourceplates.push_back(p);
    else
      raw.destinationplates.push_back(p);
  }
  return raw;
} // Labware::elwx

std::string Labware::toString() const {
  auto doc = pugi::xml_document{};
  xml::DumpDocument(doc, elwx());
  return xml::SaveXml(doc);
} // Labware::toString

void Labware::write(const fs::path& path) const {
  auto doc = pugi::xml_document{};
  xml::DumpDocument(doc, elwx());
  xml::SaveXml(doc, path);
} // Labware::write

void Labware::add(PlateInfo plate) {
  if (contains(plate.platetype))
    throw DuplicateKey{plate.platetype};
  _plates.push_back(std::move(plate));
} // Labware::add

const PlateInfo* Labware::find(std::string_view platetype) const noexcept {
  auto it = std::ranges::find(_plates, platetype, &PlateInfo::platetype);
  return (it != _plates.end()) ? &*it : nullptr;
} // Labware::find

const PlateInfo& Labware::at(std::string_view platetype) const {
  if (auto p = find(platetype))
    return *p;
  throw LookupMiss{platetype};
} // Labware::at

std::vector<std::string> Labware::keys() const {
  auto out = std::vector<std::string>{};
  out.reserve(_plates.size());
  for (const auto& p: _plates)
    out.push_back(p.platetype);
  return out;
} // Labware::keys

Table Labware::toTable() const {
  const auto& schema = xml::SchemaOf<PlateInfo>();
  static const auto columns = ColumnsOf(schema);
  auto table = Table{columns};
  for (const auto& p: _plates) {
    auto row = Table::Row{};
    row.reserve(columns.size());
    AppendCells(row, schema, p);
    table.push(std::move(row));
  }
  return table;
} // Labware::toTable

} // echolab
