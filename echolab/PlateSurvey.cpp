#include "PlateSurvey.hpp"
#include "Errors.hpp"

#include <cstddef>
#include <format>
#include <stdexcept>
#include <utility>
#include <variant>

namespace echolab::xml {

template<>
const Schema<SignalFeature>& SchemaOf<SignalFeature>() {
  using Rec = SignalFeature;
  static const auto schema = Schema<Rec>{
    "f",
    {
      ECHOLAB_ATTR(Rec, feature_type, "t"),
      ECHOLAB_ATTR(Rec, tof, "o"),
      ECHOLAB_ATTR(Rec, vpp, "v")
    },
    {}
  };
  return schema;
} // SchemaOf<SignalFeature>

template<>
const Schema<EchoSignal>& SchemaOf<EchoSignal>() {
  using Rec = EchoSignal;
  static const auto schema = Schema<Rec>{
    "e",
    {
      ECHOLAB_ATTR(Rec, signal_type,  "t"),
      ECHOLAB_ATTR(Rec, transducer_x, "x"),
      ECHOLAB_ATTR(Rec, transducer_y, "y"),
      ECHOLAB_ATTR(Rec, transducer_z, "z")
    },
    { List("features", &Rec::features) }
  };
  return schema;
} // SchemaOf<EchoSignal>

template<>
const Schema<WellSurvey>& SchemaOf<WellSurvey>() {
  using Rec = WellSurvey;
  static const auto schema = Schema<Rec>{
    "w",
    {
      ECHOLAB_ATTR(Rec, row,            "r"),
      ECHOLAB_ATTR(Rec, column,         "c"),
      ECHOLAB_ATTR(Rec, well,           "n"),
      ECHOLAB_ATTR(Rec, volume,         "vl",  ZeroNullCodec{}),
      ECHOLAB_ATTR(Rec, current_volume, "cvl", ZeroNullCodec{}),
      ECHOLAB_ATTR(Rec, status,         "status"),
      ECHOLAB_ATTR(Rec, fluid,          "fld"),
      ECHOLAB_ATTR(Rec, fluid_units,    "fldu"),
      ECHOLAB_ATTR(Rec, meniscus_x,     "x"),
      ECHOLAB_ATTR(Rec, meniscus_y,     "y"),
      ECHOLAB_ATTR(Rec, fluid_composition,  "s"),
      ECHOLAB_ATTR(Rec, dmso_homogeneous,   "fsh"),
      ECHOLAB_ATTR(Rec, dmso_inhomogeneous, "fsinh"),
      ECHOLAB_ATTR(Rec, fluid_thickness,    "t"),
      ECHOLAB_ATTR(Rec, current_fluid_thickness, "ct"),
      ECHOLAB_ATTR(Rec, bottom_thickness,        "b"),
      ECHOLAB_ATTR(Rec, fluid_thickness_homogeneous,   "fth"),
      ECHOLAB_ATTR(Rec, fluid_thickness_inhomogeneous, "ftinh"),
      ECHOLAB_ATTR(Rec, outlier,           "o"),
      ECHOLAB_ATTR(Rec, corrective_action, "a")
    },
    { Child("echo_signal", &Rec::echo_signal) }
  };
  return schema;
} // SchemaOf<WellSurvey>

template<>
const Schema<PlateSurveyData>& SchemaOf<PlateSurveyData>() {
  using Rec = PlateSurveyData;
  static const auto schema = Schema<Rec>{
    "platesurvey",
    {
      ECHOLAB_ATTR(Rec, plate_type,    "name"),
      ECHOLAB_ATTR(Rec, plate_barcode, "barcode", BarcodeCodec{}),
      ECHOLAB_ATTR(Rec, timestamp,     "date"),
      ECHOLAB_ATTR(Rec, instrument_serial_number, "serial_number"),
      ECHOLAB_ATTR(Rec, vtl,                 "vtl"),
      ECHOLAB_ATTR(Rec, original,            "original"),
      ECHOLAB_ATTR(Rec, data_format_version, "frmt"),
      ECHOLAB_ATTR(Rec, survey_rows,         "rows"),
      ECHOLAB_ATTR(Rec, survey_columns,      "cols"),
      ECHOLAB_ATTR(Rec, survey_total_wells,  "totalWells"),
      ECHOLAB_OPT_ATTR(Rec, plate_name, "plate_name"),
      ECHOLAB_OPT_ATTR(Rec, comment,    "note")
    },
    { List("wells", &Rec::wells) }
  };
  return schema;
} // SchemaOf<PlateSurveyData>

} // echolab::xml

namespace echolab {

void Validate(const PlateSurveyData& data, DiagnosticSink& sink) {
  if (data.wells.size() != static_cast<std::size_t>(data.survey_total_wells)
      || data.survey_total_wells < 0)
  {
    throw SchemaViolation{std::format(
        "number of well data items ({}) does not match reported ({})",
        data.wells.size(), data.survey_total_wells)};
  }
  if (data.data_format_version != 1) {
    sink.warning("format-version", std::format(
        "unexpected data format version {}; tested on version 1",
        data.data_format_version));
  }
} // Validate

EchoPlateSurvey::EchoPlateSurvey(PlateSurveyData data, DiagnosticSink& sink)
  : _data{std::move(data)}
{
  Validate(_data, sink);
} // EchoPlateSurvey::ctor

EchoPlateSurvey EchoPlateSurvey::FromDocument(const pugi::xml_document& doc,
                                              DiagnosticSink& sink)
{
  return EchoPlateSurvey{xml::ReadDocument<PlateSurveyData>(doc, sink), sink};
} // EchoPlateSurvey::FromDocument

EchoPlateSurvey EchoPlateSurvey::FromString(std::string_view text,
                                            DiagnosticSink& sink)
{
  auto doc = pugi::xml_document{};
  xml::LoadXml(doc, text);
  return FromDocument(doc, sink);
} // EchoPlateSurvey::FromString

EchoPlateSurvey EchoPlateSurvey::Read(const fs::path& path,
                                      DiagnosticSink& sink)
{
  auto doc = pugi::xml_document{};
  xml::LoadXml(doc, path);
  return FromDocument(doc, sink);
} // EchoPlateSurvey::Read

void EchoPlateSurvey::dump(pugi::xml_document& doc) const
  { xml::DumpDocument(doc, _data); }

std::string EchoPlateSurvey::toString() const {
  auto doc = pugi::xml_document{};
  dump(doc);
  return xml::SaveXml(doc);
} // EchoPlateSurvey::toString

fs::path EchoPlateSurvey::write(const fs::path& path) const {
  auto doc = pugi::xml_document{};
  dump(doc);
  xml::SaveXml(doc, path);
  return path;
} // EchoPlateSurvey::write(path)

fs::path EchoPlateSurvey::write(const PathFormatter& format) const
  { return write(format(*this)); }

Table EchoPlateSurvey::toTable() const {
  const auto& wellSchema   = xml::SchemaOf<WellSurvey>();
  const auto& headerSchema = xml::SchemaOf<PlateSurveyData>();
  static const auto columns = [&] {
    auto out = ColumnsOf(wellSchema);
    for (auto& c: ColumnsOf(headerSchema))
      out.push_back(std::move(c));
    return out;
  }();
  auto header = Table::Row{};
  AppendCells(header, headerSchema, _data);
  auto table = Table{columns};
  for (const auto& w: _data.wells) {
    auto row = Table::Row{};
    row.reserve(columns.size());
    AppendCells(row, wellSchema, w);
    row.insert(row.end(), header.begin(), header.end());
    table.push(std::move(row));
  }
  return table;
} // EchoPlateSurvey::toTable

namespace {

using HeaderField = xml::AttrField<PlateSurveyData>;

// A literal run or a header field.
using Segment = std::variant<std::string, const HeaderField*>;

std::vector<Segment> ParsePattern(std::string_view pattern) {
  const auto& schema = xml::SchemaOf<PlateSurveyData>();
  auto out = std::vector<Segment>{};
  auto literal = std::string{};
  for (auto i = std::size_t{0}; i != pattern.size(); ++i) {
    const auto ch = pattern[i];
    if (ch == '}') {
      if (i+1 == pattern.size() || pattern[i+1] != '}') {
        throw std::invalid_argument{std::format(
            "unmatched '}}' in path pattern \"{}\"", pattern)};
      }
      literal += '}';
      ++i;
      continue;
    }
    if (ch != '{') {
      literal += ch;
      continue;
    }
    if (i+1 < pattern.size() && pattern[i+1] == '{') {
      literal += '{';
      ++i;
      continue;
    }
    const auto close = pattern.find('}', i+1);
    if (close == std::string_view::npos) {
      throw std::invalid_argument{std::format(
          "unmatched '{{' in path pattern \"{}\"", pattern)};
    }
    const auto name = pattern.substr(i+1, close-i-1);
    const auto* field = schema.find(name);
    if (!field) {
      throw std::invalid_argument{std::format(
          "unknown field \"{}\" in path pattern \"{}\"", name, pattern)};
    }
    if (!literal.empty())
      out.emplace_back(std::exchange(literal, std::string{}));
    out.emplace_back(field);
    i = close;
  }
  if (!literal.empty())
    out.emplace_back(std::move(literal));
  return out;
} // ParsePattern

} // local

PathFormatter PathTemplate(std::string_view pattern) {
  return [segments = ParsePattern(pattern)](const EchoPlateSurvey& survey) {
    auto path = std::string{};
    for (const auto& s: segments) {
      if (const auto* text = std::get_if<std::string>(&s)) {
        path += *text;
      } else if (auto v = std::get<const HeaderField*>(s)->encode(survey.data()))
      {
        path += *v;
      }
    }
    return fs::path{path};
  };
} // PathTemplate

} // echolab
