#include <gtest/gtest.h>

#include <string>

#include "xmlkit/xmldecoder.hpp"
#include "xmlkit/xmlencoder.hpp"

using xmlkit::Data;
using xmlkit::XmlDecoder;
using xmlkit::XmlDocument;

class XmlDecoderTest : public ::testing::Test {
 protected:
  Data decode(const std::string& xml) {
    document.loadXml(xml);
    return decoder.decode(document);
  }

  XmlDocument document{"1.0", "UTF-8"};
  XmlDecoder decoder;
};

TEST_F(XmlDecoderTest, DecodesNestedRecord) {
  const Data expected = Data::parse(R"({"Invoice": {
      "@attributes": {"id": "1"},
      "Number": "17",
      "Line": [{"Item": "Pen"}, {"Item": "Ink"}],
      "Empty": null}})");

  EXPECT_EQ(decode("<Invoice id=\"1\"><Number>17</Number>"
                   "<Line><Item>Pen</Item></Line><Line><Item>Ink</Item></Line>"
                   "<Empty/></Invoice>"),
            expected);
}

TEST_F(XmlDecoderTest, CollectsLeafTwins) {
  EXPECT_EQ(decode("<r><i>1</i><i></i><i>x</i></r>"),
            Data::parse(R"({"r": {"i": ["1", null, "x"]}})"));
}

TEST_F(XmlDecoderTest, TwinsWithAttributesBecomeRecords) {
  EXPECT_EQ(decode("<r><i a=\"1\">x</i><i>y</i></r>"),
            Data::parse(R"({"r": {"i": [
                {"@attributes": {"a": "1"}, "@value": "x"}, "y"]}})"));
}

TEST_F(XmlDecoderTest, KeepsTextNextToAttributes) {
  EXPECT_EQ(decode("<r><a u=\"kg\">5</a></r>"),
            Data::parse(R"({"r": {"a": {"@attributes": {"u": "kg"},
                                        "@value": "5"}}})"));
}

TEST_F(XmlDecoderTest, ConcatenatesMixedText) {
  EXPECT_EQ(decode("<a>x<b/>y</a>"),
            Data::parse(R"({"a": {"@value": "xy", "b": null}})"));
}

TEST_F(XmlDecoderTest, IgnoresFormattingWhitespace) {
  EXPECT_EQ(decode("<r>\n  <a> 1 </a>\n  <b/>\n</r>"),
            Data::parse(R"({"r": {"a": "1", "b": null}})"));
}

TEST_F(XmlDecoderTest, UsesQualifiedNames) {
  EXPECT_EQ(decode("<x:r xmlns:x=\"urn:x\" xmlns:y=\"urn:y\" y:at=\"v\">"
                   "<x:a>1</x:a></x:r>"),
            Data::parse(R"({"x:r": {"@attributes": {"y:at": "v"},
                                    "x:a": "1"}})"));
}

TEST_F(XmlDecoderTest, DecodesSingleElement) {
  decode("<r><a><b>1</b></a><c>2</c></r>");
  EXPECT_EQ(decoder.decode(document.getNodes("/r/a").item(0)),
            Data::parse(R"({"a": {"b": "1"}})"));
  EXPECT_EQ(decoder.decode(static_cast<xmlNodePtr>(nullptr)), Data::object());
}

TEST_F(XmlDecoderTest, EmptyDocumentDecodesToEmptyObject) {
  XmlDocument empty;
  EXPECT_EQ(decoder.decode(empty), Data::object());
}

TEST_F(XmlDecoderTest, RestoresEncodedData) {
  const Data data = Data::parse(R"({"Invoice": {
      "@attributes": {"id": "7"},
      "Line": [{"Qty": "2", "Item": "Pen"}, {"Qty": "3", "Item": "Ink"}],
      "Note": "hi"}})");

  xmlkit::XmlEncoder encoder;
  auto encoded = encoder.encode(data);
  EXPECT_EQ(decoder.decode(*encoded), data);
}
