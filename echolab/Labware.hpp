/// @file
/// @brief Labware definitions: EchoLabware documents, ELWX and ELW variants.
///
/// ELWX (generic) spells out every plateinfo attribute. ELW (fixed
/// geometry) omits usage, welllength and plateformat: usage follows from
/// the list a plate is in, welllength equals wellwidth and plateformat is
/// unknown. Both are read into one list of PlateInfo; ELWX is always
/// written.

#pragma once

#include "Codec.hpp"
#include "Diagnostics.hpp"
#include "Table.hpp"
#include "XmlMap.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace echolab {

namespace fs = std::filesystem;

enum class Usage { Source, Destination };

/// Wire spelling: "SRC" / "DEST".
const char* Name(Usage x) noexcept;

template<>
struct Codec<Usage> {
  using value_type = Usage;
  static constexpr auto Column = ColumnType::String;
  static Usage decode(std::string_view s);
  static std::string encode(Usage v) { return Name(v); }
  static Cell cell(Usage v) { return std::string{Name(v)}; }
}; // Codec<Usage>

struct PlateInfo {            // plateinfo (ELWX)
  std::string platetype;
  std::string plateformat;
  Usage usage = Usage::Source;
  std::optional<std::string> fluid;
  std::string manufacturer;
  std::string lotnumber;
  std::string partnumber;
  unsigned rows           = 0;
  unsigned cols           = 0;
  unsigned a1offsety      = 0;
  unsigned centerspacingx = 0;
  unsigned centerspacingy = 0;
  unsigned plateheight    = 0;
  unsigned skirtheight    = 0;
  unsigned wellwidth      = 0;
  unsigned welllength     = 0;
  unsigned wellcapacity   = 0;
  double bottominset    = 0.0;
  double centerwellposx = 0.0;
  double centerwellposy = 0.0;
  std::optional<double> minwellvol;
  std::optional<double> maxwellvol;
  std::optional<double> maxvoltotal;
  std::optional<double> minvolume;
  std::optional<double> dropvolume;

  std::pair<unsigned, unsigned> shape() const noexcept { return {rows, cols}; }
  bool operator==(const PlateInfo&) const = default;
}; // PlateInfo

/// plateinfo as written in ELW files. Project with info().
struct ElwPlate {
  static constexpr char PlateFormat[] = "UNKNOWN";
  std::string platetype;
  std::optional<std::string> fluid;
  std::string manufacturer;
  std::string lotnumber;
  std::string partnumber;
  unsigned rows           = 0;
  unsigned cols           = 0;
  unsigned a1offsety      = 0;
  unsigned centerspacingx = 0;
  unsigned centerspacingy = 0;
  unsigned plateheight    = 0;
  unsigned skirtheight    = 0;
  unsigned wellwidth      = 0;
  unsigned wellcapacity   = 0;
  double bottominset    = 0.0;
  double centerwellposx = 0.0;
  double centerwellposy = 0.0;
  std::optional<double> minwellvol;
  std::optional<double> maxwellvol;
  std::optional<double> maxvoltotal;
  std::optional<double> minvolume;
  std::optional<double> dropvolume;

  unsigned welllength() const noexcept { return wellwidth; }
  static std::string_view plateformat() noexcept { return PlateFormat; }

  /// The plate as seen from a list whose entries all have `usage`.
  PlateInfo info(Usage usage) const;
  bool operator==(const ElwPlate&) const = default;
}; // ElwPlate

/// Raw EchoLabware document: <sourceplates> and <destinationplates>.
template<class Plate>
struct LabwareXml {
  std::vector<Plate> sourceplates;
  std::vector<Plate> destinationplates;
}; // LabwareXml

using ElwxDocument = LabwareXml<PlateInfo>;
using ElwDocument  = LabwareXml<ElwPlate>;

/// Plate definitions keyed by platetype, in document order.
class Labware {
public:
  using Plates = std::vector<PlateInfo>;
  using const_iterator = Plates::const_iterator;

private:
  Plates _plates;

public:
  Labware() = default;
  /// @throws DuplicateKey if two plates share a platetype.
  explicit Labware(Plates plates);
  explicit Labware(const ElwxDocument& raw);
  explicit Labware(const ElwDocument& raw);

  /// Tries ELWX, then ELW. @throws VariantMismatch if neither matches.
  static Labware FromString(std::string_view text,
                            DiagnosticSink& sink = DefaultSink());
  static Labware Read(const fs::path& path,
                      DiagnosticSink& sink = DefaultSink());
  static Labware FromDocument(const pugi::xml_document& doc,
                              DiagnosticSink& sink = DefaultSink());

  ElwxDocument elwx() const;
  std::string toString() const;
  void write(const fs::path& path) const;

  /// @throws DuplicateKey; the collection is unchanged on failure.
  void add(PlateInfo plate);

  /// @throws LookupMiss
  const PlateInfo& at(std::string_view platetype) const;
  const PlateInfo& operator[](std::string_view platetype) const
    { return at(platetype); }
  const PlateInfo* find(std::string_view platetype) const noexcept;
  bool contains(std::string_view platetype) const noexcept
    { return find(platetype) != nullptr; }
  std::vector<std::string> keys() const;

  const Plates& plates() const noexcept { return _plates; }
  std::size_t size() const noexcept { return _plates.size(); }
  bool empty() const noexcept { return _plates.empty(); }
  const_iterator begin() const noexcept { return _plates.begin(); }
  const_iterator end()   const noexcept { return _plates.end();   }

  Table toTable() const;

  bool operator==(const Labware&) const = default;
}; // Labware

} // echolab

namespace echolab::xml {
template<> const Schema<PlateInfo>&    SchemaOf<PlateInfo>();
template<> const Schema<ElwPlate>&     SchemaOf<ElwPlate>();
template<> const Schema<ElwxDocument>& SchemaOf<ElwxDocument>();
template<> const Schema<ElwDocument>&  SchemaOf<ElwDocument>();
} // echolab::xml
