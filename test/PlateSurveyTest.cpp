#include "echolab/PlateSurvey.hpp"
#include "echolab/Errors.hpp"
#include "Samples.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

using namespace echolab;
using echolab::test::Survey;

namespace {

WellSurvey MakeWell(unsigned row, unsigned column, std::string name) {
  auto w = WellSurvey{};
  w.row = row;
  w.column = column;
  w.well = std::move(name);
  w.volume = 30.5;
  w.fluid = "DMSO";
  w.fluid_units = "%";
  w.echo_signal.signal_type = "TB";
  w.echo_signal.features = {{"B", 2.5, 0.75}};
  return w;
} // MakeWell

PlateSurveyData MakeData(int totalWells) {
  auto d = PlateSurveyData{};
  d.plate_type = "384PP_DMSO2";
  d.plate_barcode = "E5-0001";
  d.timestamp = Timestamp::Parse("2023-08-31T14:53:25");
  d.instrument_serial_number = "E5XX-1234";
  d.survey_rows = 16;
  d.survey_columns = 24;
  d.survey_total_wells = totalWells;
  return d;
} // MakeData

} // local

TEST(PlateSurvey, Reads) {
  auto sink = CollectingSink{};
  const auto s = EchoPlateSurvey::FromString(Survey, sink);
  EXPECT_EQ(s->plate_type, "384PP_DMSO2");
  EXPECT_FALSE(s->plate_barcode.has_value());
  EXPECT_EQ(s->timestamp.str(), "2023-08-31T14:53:25.6630000");
  EXPECT_EQ(s->survey_total_wells, 2);
  EXPECT_FALSE(s->plate_name.has_value());
  EXPECT_FALSE(s->comment.has_value());
  ASSERT_EQ(s.wells().size(), 2u);

  const auto& a1 = s.wells()[0];
  EXPECT_EQ(a1.well, "A1");
  EXPECT_EQ(a1.volume, std::optional<double>{41.25});
  EXPECT_FALSE(a1.current_volume.has_value());
  EXPECT_EQ(a1.fluid_composition, 70.5);
  EXPECT_EQ(a1.fluid_thickness, 8.125);
  ASSERT_EQ(a1.echo_signal.features.size(), 2u);
  EXPECT_EQ(a1.echo_signal.features[0].feature_type, "B");
  EXPECT_EQ(a1.echo_signal.features[1].tof, 7.25);

  const auto& a2 = s.wells()[1];
  EXPECT_EQ(a2.column, 1u);
  EXPECT_EQ(a2.status, "empty");
  EXPECT_TRUE(a2.echo_signal.features.empty());
  EXPECT_TRUE(sink.diagnostics().empty());
}

TEST(PlateSurvey, ZeroVolumeStaysZeroOnWrite) {
  const auto s = EchoPlateSurvey::FromString(Survey, DefaultSink());
  EXPECT_FALSE(s.wells()[1].volume.has_value());
  auto doc = pugi::xml_document{};
  s.dump(doc);
  const auto a2 = doc.child("platesurvey").find_child_by_attribute("w", "n",
                                                                   "A2");
  ASSERT_TRUE(a2);
  EXPECT_STREQ(a2.attribute("vl").value(), "0");
  EXPECT_STREQ(doc.child("platesurvey").attribute("barcode").value(),
               "UnknownBarCode");
}

TEST(PlateSurvey, RoundTrip) {
  const auto s = EchoPlateSurvey::FromString(Survey, DefaultSink());
  const auto again = EchoPlateSurvey::FromString(s.toString(), DefaultSink());
  EXPECT_EQ(again, s);
  ASSERT_EQ(again.wells().size(), 2u);
  EXPECT_EQ(again.wells()[0].well, "A1");
  EXPECT_EQ(again.wells()[1].well, "A2");
}

TEST(PlateSurvey, RoundTripKeepsOptionalHeader) {
  auto d = MakeData(1);
  d.wells.push_back(MakeWell(3, 4, "D5"));
  d.plate_name = "compound library 7";
  d.comment = "rescan";
  const auto s = EchoPlateSurvey{d};
  const auto text = s.toString();
  EXPECT_NE(text.find("note=\"rescan\""), std::string::npos);
  const auto again = EchoPlateSurvey::FromString(text, DefaultSink());
  EXPECT_EQ(again, s);
  EXPECT_EQ(again->plate_barcode, std::optional<std::string>{"E5-0001"});
}

TEST(PlateSurvey, FileRoundTrip) {
  const auto s = EchoPlateSurvey::FromString(Survey, DefaultSink());
  const auto path = s.write(echolab::test::TempPath("survey.xml"));
  EXPECT_EQ(path, echolab::test::TempPath("survey.xml"));
  EXPECT_EQ(EchoPlateSurvey::Read(path, DefaultSink()), s);
}

TEST(PlateSurvey, WellCountMismatch) {
  constexpr auto text = R"(<platesurvey name="384PP" barcode="B1"
      date="2023-08-31T14:53:25" serial_number="S" vtl="1" original="0"
      frmt="1" rows="16" cols="24" totalWells="2">
    <w r="0" c="0" n="A1" vl="0" cvl="0" status="" fld="DMSO" fldu="%"
       x="0" y="0" s="0" fsh="0" fsinh="0" t="0" ct="0" b="0" fth="0"
       ftinh="0" o="0" a=""><e t="TB" x="0" y="0" z="0"/></w>
  </platesurvey>)";
  EXPECT_THROW(EchoPlateSurvey::FromString(text, DefaultSink()),
               SchemaViolation);
}

TEST(PlateSurvey, WellCountMustMatchExactly) {
  auto d = MakeData(1);
  EXPECT_THROW(EchoPlateSurvey{d}, SchemaViolation);
  d.wells.push_back(MakeWell(0, 0, "A1"));
  EXPECT_NO_THROW(EchoPlateSurvey{d});
  d.wells.push_back(MakeWell(0, 1, "A2"));
  EXPECT_THROW(EchoPlateSurvey{d}, SchemaViolation);
  d.survey_total_wells = -1;
  EXPECT_THROW(EchoPlateSurvey{d}, SchemaViolation);
}

TEST(PlateSurvey, FormatVersionWarning) {
  auto d = MakeData(0);
  d.data_format_version = 2;
  auto sink = CollectingSink{};
  const auto s = EchoPlateSurvey{d, sink};
  ASSERT_EQ(sink.diagnostics().size(), 1u);
  EXPECT_EQ(sink.diagnostics()[0].severity, Severity::Warning);
  EXPECT_EQ(sink.diagnostics()[0].code, "format-version");
  EXPECT_EQ(s->data_format_version, 2);
}

TEST(PlateSurvey, Table) {
  const auto s = EchoPlateSurvey::FromString(Survey, DefaultSink());
  const auto t = s.toTable();
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t.columns().size(), 20u + 12u);
  EXPECT_EQ(t.columns().front().name, "row");
  EXPECT_EQ(t.columns()[20].name, "plate_type");
  EXPECT_FALSE(t.column("echo_signal").has_value());
  EXPECT_FALSE(t.column("features").has_value());

  EXPECT_EQ(std::get<std::string>(t.at(0, "well")), "A1");
  EXPECT_EQ(std::get<double>(t.at(0, "volume")), 41.25);
  EXPECT_TRUE(std::holds_alternative<std::monostate>(t.at(1, "volume")));
  for (auto row = std::size_t{0}; row != t.size(); ++row) {
    EXPECT_EQ(std::get<std::string>(t.at(row, "plate_type")), "384PP_DMSO2");
    EXPECT_EQ(std::get<std::int64_t>(t.at(row, "survey_total_wells")), 2);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(
        t.at(row, "plate_barcode")));
    EXPECT_EQ(std::get<Timestamp>(t.at(row, "timestamp")).str(),
              "2023-08-31T14:53:25.6630000");
  }
  const auto ts = t.column("timestamp");
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(t.columns()[*ts].type, ColumnType::Timestamp);
}

TEST(PlateSurvey, PathTemplate) {
  const auto s = EchoPlateSurvey{[] {
    auto d = MakeData(0);
    d.plate_barcode = std::nullopt;
    return d;
  }()};
  const auto fmt = PathTemplate("{plate_type}_{plate_barcode}_{{x}}.xml");
  EXPECT_EQ(fmt(s), fs::path{"384PP_DMSO2_UnknownBarCode_{x}.xml"});
  EXPECT_EQ(PathTemplate("{plate_name}.xml")(s), fs::path{".xml"});
  EXPECT_EQ(PathTemplate("{timestamp}")(s), fs::path{"2023-08-31T14:53:25"});
}

TEST(PlateSurvey, PathTemplateRejects) {
  EXPECT_THROW(PathTemplate("{nope}.xml"), std::invalid_argument);
  EXPECT_THROW(PathTemplate("{wells}.xml"), std::invalid_argument);
  EXPECT_THROW(PathTemplate("{plate_type.xml"), std::invalid_argument);
  EXPECT_THROW(PathTemplate("plate_type}.xml"), std::invalid_argument);
}

TEST(PlateSurvey, WriteThroughFormatter) {
  const auto s = EchoPlateSurvey::FromString(Survey, DefaultSink());
  const auto dir = echolab::test::TempPath("");
  const auto path = s.write([&dir](const EchoPlateSurvey& x) {
    return dir / (x->plate_type + "-survey.xml");
  });
  EXPECT_EQ(path.filename(), "384PP_DMSO2-survey.xml");
  EXPECT_EQ(EchoPlateSurvey::Read(path, DefaultSink()), s);
}
