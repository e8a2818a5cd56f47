#include "echolab/XmlMap.hpp"
#include "echolab/Errors.hpp"
#include "echolab/PlateSurvey.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace echolab;

class XmlMapTest: public ::testing::Test {
protected:
  pugi::xml_document doc;
  void load(std::string_view text) { xml::LoadXml(doc, text); }
}; // XmlMapTest

TEST_F(XmlMapTest, ReadsAttributesAndNestedLists) {
  load(R"(<e t="TB" x="1.5" y="0" z="4.5">
                              <f t="B" o="2.5" v="0.75"/>
                              <f t="M" o="7.25" v="1.5"/>
                            </e>)");
  auto sink = CollectingSink{};
  const auto e = xml::ReadDocument<EchoSignal>(doc, sink);
  EXPECT_EQ(e.signal_type, "TB");
  EXPECT_EQ(e.transducer_x, 1.5);
  ASSERT_EQ(e.features.size(), 2u);
  EXPECT_EQ(e.features[0].feature_type, "B");
  EXPECT_EQ(e.features[1].tof, 7.25);
  EXPECT_TRUE(sink.diagnostics().empty());
}

TEST_F(XmlMapTest, MissingRequiredAttribute) {
  load(R"(<f t="B" o="2.5"/>)");
  try {
    xml::ReadDocument<SignalFeature>(doc, DefaultSink());
    FAIL() << "expected MissingRequiredField";
  }
  catch (const MissingRequiredField& x) {
    EXPECT_EQ(x.tag(), "f");
    EXPECT_EQ(x.field(), "v");
  }
}

TEST_F(XmlMapTest, MissingRequiredChild) {
  load(R"(<w r="0" c="0" n="A1" vl="0" cvl="0" status=""
      fld="DMSO" fldu="%" x="0" y="0" s="0" fsh="0" fsinh="0" t="0" ct="0"
      b="0" fth="0" ftinh="0" o="0" a=""/>)");
  try {
    xml::ReadDocument<WellSurvey>(doc, DefaultSink());
    FAIL() << "expected MissingRequiredField";
  }
  catch (const MissingRequiredField& x) {
    EXPECT_EQ(x.tag(), "w");
    EXPECT_EQ(x.field(), "e");
  }
}

TEST_F(XmlMapTest, InvalidScalar) {
  load(R"(<f t="B" o="fast" v="1"/>)");
  try {
    xml::ReadDocument<SignalFeature>(doc, DefaultSink());
    FAIL() << "expected InvalidValue";
  }
  catch (const InvalidValue& x) {
    EXPECT_EQ(x.tag(), "f");
    EXPECT_EQ(x.field(), "o");
    EXPECT_EQ(x.value(), "fast");
  }
}

TEST_F(XmlMapTest, UnknownNodesReportedAtInfo) {
  load(R"(<e t="TB" x="0" y="0" z="0" gain="3">
                              <calibration/>
                            </e>)");
  auto sink = CollectingSink{};
  const auto e = xml::ReadDocument<EchoSignal>(doc, sink);
  EXPECT_TRUE(e.features.empty());
  ASSERT_EQ(sink.diagnostics().size(), 2u);
  for (const auto& d: sink.diagnostics())
    EXPECT_EQ(d.severity, Severity::Info);
  EXPECT_TRUE(sink.contains("ignored-attribute"));
  EXPECT_TRUE(sink.contains("ignored-element"));
}

TEST_F(XmlMapTest, WrongRootElement) {
  load(R"(<g t="B" o="1" v="1"/>)");
  EXPECT_THROW(xml::ReadDocument<SignalFeature>(doc, DefaultSink()),
               MissingRequiredField);
}

TEST_F(XmlMapTest, SyntaxError) {
  EXPECT_THROW(load("<e t=\"TB\""), XmlSyntaxError);
}

TEST_F(XmlMapTest, DumpKeepsSchemaOrder) {
  const auto e = EchoSignal{"TB", 1.5, 0.0, 4.5, {{"B", 2.5, 0.75}}};
  xml::DumpDocument(doc, e);
  const auto root = doc.document_element();
  EXPECT_STREQ(root.name(), "e");
  auto names = std::string{};
  for (const auto& a: root.attributes())
    names += a.name();
  EXPECT_EQ(names, "txyz");
  EXPECT_STREQ(root.attribute("x").value(), "1.5");
  EXPECT_STREQ(root.child("f").attribute("v").value(), "0.75");

  auto sink = NullSink{};
  EXPECT_EQ(xml::ReadDocument<EchoSignal>(doc, sink), e);
}

TEST_F(XmlMapTest, OptionalAttributeOmittedWhenAbsent) {
  auto data = PlateSurveyData{};
  data.plate_type = "384PP";
  data.timestamp = Timestamp::Parse("2023-08-31T14:53:25");
  xml::DumpDocument(doc, data);
  const auto root = doc.document_element();
  EXPECT_FALSE(root.attribute("plate_name"));
  EXPECT_FALSE(root.attribute("note"));
  EXPECT_STREQ(root.attribute("barcode").value(), "UnknownBarCode");
}
