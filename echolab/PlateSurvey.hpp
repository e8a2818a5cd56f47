/// @file
/// @brief Plate survey documents (<platesurvey>).
///
/// A survey holds the header of one scan session and the wells in scan
/// order. Each well carries one echo signal with its detected features.

#pragma once

#include "Codec.hpp"
#include "Diagnostics.hpp"
#include "Table.hpp"
#include "Timestamp.hpp"
#include "XmlMap.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace echolab {

namespace fs = std::filesystem;

struct SignalFeature {        // f
  std::string feature_type;   // t
  double tof = 0.0;           // o
  double vpp = 0.0;           // v
  bool operator==(const SignalFeature&) const = default;
}; // SignalFeature

struct EchoSignal {           // e
  std::string signal_type;    // t
  double transducer_x = 0.0;  // x
  double transducer_y = 0.0;  // y
  double transducer_z = 0.0;  // z
  std::vector<SignalFeature> features;
  bool operator==(const EchoSignal&) const = default;
}; // EchoSignal

struct WellSurvey {           // w
  unsigned row    = 0;        // r
  unsigned column = 0;        // c
  std::string well;           // n
  std::optional<double> volume;          // vl, 0 when absent
  std::optional<double> current_volume;  // cvl, 0 when absent
  std::string status;
  std::string fluid;          // fld
  std::string fluid_units;    // fldu
  double meniscus_x = 0.0;                    // x
  double meniscus_y = 0.0;                    // y
  double fluid_composition = 0.0;             // s
  double dmso_homogeneous = 0.0;              // fsh
  double dmso_inhomogeneous = 0.0;            // fsinh
  double fluid_thickness = 0.0;               // t
  double current_fluid_thickness = 0.0;       // ct
  double bottom_thickness = 0.0;              // b
  double fluid_thickness_homogeneous = 0.0;   // fth
  double fluid_thickness_inhomogeneous = 0.0; // ftinh
  double outlier = 0.0;                       // o
  std::string corrective_action;              // a
  EchoSignal echo_signal;
  bool operator==(const WellSurvey&) const = default;
}; // WellSurvey

struct PlateSurveyData {      // platesurvey
  std::string plate_type;                     // name
  std::optional<std::string> plate_barcode;   // barcode
  Timestamp timestamp;                        // date
  std::string instrument_serial_number;       // serial_number
  int vtl = 0;
  int original = 0;
  int data_format_version = 1;                // frmt
  int survey_rows = 0;                        // rows
  int survey_columns = 0;                     // cols
  int survey_total_wells = 0;                 // totalWells
  std::vector<WellSurvey> wells;
  std::optional<std::string> plate_name;
  std::optional<std::string> comment;         // note
  bool operator==(const PlateSurveyData&) const = default;
}; // PlateSurveyData

/// Cross-field checks.
/// @throws SchemaViolation if the well count differs from totalWells.
/// Reports "format-version" at Warning for a data format other than 1.
void Validate(const PlateSurveyData& data, DiagnosticSink& sink);

class EchoPlateSurvey;

using PathFormatter = std::function<fs::path(const EchoPlateSurvey&)>;

/// A validated survey. There are no mutators.
class EchoPlateSurvey {
  PlateSurveyData _data;

public:
  /// @throws SchemaViolation
  explicit EchoPlateSurvey(PlateSurveyData data,
                           DiagnosticSink& sink = DefaultSink());

  static EchoPlateSurvey Read(const fs::path& path,
                              DiagnosticSink& sink = DefaultSink());
  static EchoPlateSurvey FromString(std::string_view text,
                                    DiagnosticSink& sink = DefaultSink());
  static EchoPlateSurvey FromDocument(const pugi::xml_document& doc,
                                      DiagnosticSink& sink = DefaultSink());

  const PlateSurveyData& data() const noexcept { return _data; }
  const PlateSurveyData* operator->() const noexcept { return &_data; }
  const std::vector<WellSurvey>& wells() const noexcept { return _data.wells; }

  void dump(pugi::xml_document& doc) const;
  std::string toString() const;

  /// Both return the path written.
  fs::path write(const fs::path& path) const;
  fs::path write(const PathFormatter& format) const;

  /// One row per well: well attributes, then the header on every row.
  Table toTable() const;

  bool operator==(const EchoPlateSurvey&) const = default;
}; // EchoPlateSurvey

/// Formatter substituting "{name}" with the encoded header field of that
/// logical name, e.g. "{plate_type}_{timestamp}.xml". "{{" and "}}" are
/// literal braces. An absent optional field expands to nothing.
/// @throws std::invalid_argument for an unknown name or an unmatched brace.
PathFormatter PathTemplate(std::string_view pattern);

} // echolab

namespace echolab::xml {
template<> const Schema<SignalFeature>&   SchemaOf<SignalFeature>();
template<> const Schema<EchoSignal>&      SchemaOf<EchoSignal>();
template<> const Schema<WellSurvey>&      SchemaOf<WellSurvey>();
template<> const Schema<PlateSurveyData>& SchemaOf<PlateSurveyData>();
} // echolab::xml
