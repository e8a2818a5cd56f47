#include "echolab/Diagnostics.hpp"
#include "echolab/Errors.hpp"
#include "echolab/Labware.hpp"
#include "echolab/PlateSurvey.hpp"
#include "echolab/Table.hpp"
#include "echolab/XmlMap.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs  = std::filesystem;
namespace gsl = gsl_lite;

using namespace echolab;

namespace {

constexpr auto UsageText =
    "usage: echolab <file.xml> [--csv FILE] [--out FILE|PATTERN]"
    " [--quiet|--verbose]\n";

struct Options {
  fs::path input;
  fs::path csv;
  std::string out;
  Severity threshold = Severity::Warning;
}; // Options

Options ParseArgs(int argc, const gsl::czstring* argv) {
  auto opts = Options{};
  opts.input = fs::path{argv[1]};
  for (int i = 2; i < argc; ++i) {
    const auto arg = std::string_view{argv[i]};
    if (arg == "--csv" && i + 1 < argc) {
      opts.csv = fs::path{argv[++i]};
    } else if (arg == "--out" && i + 1 < argc) {
      opts.out = argv[++i];
    } else if (arg == "--quiet") {
      opts.threshold = Severity::Error;
    } else if (arg == "--verbose") {
      opts.threshold = Severity::Info;
    } else {
      throw std::invalid_argument{"unknown option: " + std::string{arg}};
    }
  }
  return opts;
} // ParseArgs

void SaveCsv(const Table& table, const fs::path& path) {
  auto ofs = std::ofstream{path, std::ios::binary};
  if (!ofs)
    throw std::runtime_error("cannot open for writing: " + path.string());
  WriteCsv(ofs, table);
  std::cout << "wrote " << path << " (" << table.size() << " rows)\n";
} // SaveCsv

void PrintSummary(const Labware& labware) {
  std::cout << "Plates: " << labware.size() << '\n';
  for (const auto& p: labware) {
    const auto [rows, cols] = p.shape();
    std::cout << "  " << Name(p.usage) << ' ' << p.platetype
              << " (" << rows << 'x' << cols
              << ", format " << p.plateformat << ")\n";
  }
} // PrintSummary(Labware)

void PrintSummary(const EchoPlateSurvey& survey) {
  std::cout << "Survey: " << survey->plate_type
            << " barcode=" << survey->plate_barcode.value_or("-")
            << " date=" << survey->timestamp.str() << '\n';
  std::cout << "  grid " << survey->survey_rows << 'x'
            << survey->survey_columns
            << ", wells " << survey.wells().size() << '\n';
  auto measured = 0;
  for (const auto& w: survey.wells()) {
    if (w.volume)
      ++measured;
  }
  std::cout << "  wells with volume: " << measured << '\n';
} // PrintSummary(EchoPlateSurvey)

void RunLabware(const pugi::xml_document& doc, const Options& opts,
                DiagnosticSink& sink)
{
  const auto labware = Labware::FromDocument(doc, sink);
  PrintSummary(labware);
  if (!opts.csv.empty())
    SaveCsv(labware.toTable(), opts.csv);
  if (!opts.out.empty()) {
    labware.write(opts.out);
    std::cout << "wrote " << fs::path{opts.out} << '\n';
  }
} // RunLabware

void RunSurvey(const pugi::xml_document& doc, const Options& opts,
               DiagnosticSink& sink)
{
  const auto survey = EchoPlateSurvey::FromDocument(doc, sink);
  PrintSummary(survey);
  if (!opts.csv.empty())
    SaveCsv(survey.toTable(), opts.csv);
  if (!opts.out.empty()) {
    const auto path = (opts.out.find('{') != std::string::npos)
                      ? survey.write(PathTemplate(opts.out))
                      : survey.write(fs::path{opts.out});
    std::cout << "wrote " << path << '\n';
  }
} // RunSurvey

} // local

// ---------- main ----------

auto main(int argc, char** argv) -> int {
  if (argc < 2) {
    std::cerr << UsageText;
    return EXIT_FAILURE;
  }
  try {
    const auto opts = ParseArgs(argc, argv);
    auto sink = StreamSink{std::cerr, opts.threshold};

    auto doc = pugi::xml_document{};
    xml::LoadXml(doc, opts.input);
    const auto root = std::string_view{doc.document_element().name()};
    if (root == "EchoLabware")
      RunLabware(doc, opts, sink);
    else if (root == "platesurvey")
      RunSurvey(doc, opts, sink);
    else
      throw Error{"unrecognized document element <" + std::string{root} + ">"};

    return EXIT_SUCCESS;
  }
  catch (const std::exception& e) {
    std::cerr << "std::exception: " << e.what() << '\n';
  }
  catch (...) {
    std::cerr << "unknown exception\n";
  }
  return EXIT_FAILURE;
} // main
