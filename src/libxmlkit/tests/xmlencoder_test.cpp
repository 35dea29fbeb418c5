#include <gtest/gtest.h>

#include <string>

#include "xmlkit/xmlencoder.hpp"
#include "xmlkit/xmlexception.hpp"

using xmlkit::Data;
using xmlkit::XmlEncoder;
using xmlkit::XmlNamespace;

class XmlEncoderTest : public ::testing::Test {
 protected:
  std::string encode(const std::string& json,
                     const std::optional<XmlNamespace>& ns = std::nullopt) {
    return encoder.encode(Data::parse(json), ns)->c14n();
  }

  XmlEncoder encoder;
};

TEST_F(XmlEncoderTest, BuildsNestedElements) {
  EXPECT_EQ(encode(R"({"Invoice": {"Header": {"Number": "17"}, "Note": "x"}})"),
            "<Invoice><Header><Number>17</Number></Header><Note>x</Note>"
            "</Invoice>");
}

TEST_F(XmlEncoderTest, SkipsEmptyValues) {
  EXPECT_EQ(encode(R"({"r": {"n": null, "f": false, "e": [], "o": {},
                            "s": "", "t": true}})"),
            "<r><s></s><t></t></r>");
}

TEST_F(XmlEncoderTest, WritesAttributesAndValue) {
  EXPECT_EQ(encode(R"({"Amount": {"@attributes": {"currency": "EUR", "n": 3},
                                  "@value": 12.5}})"),
            "<Amount currency=\"EUR\" n=\"3\">12.5</Amount>");
}

TEST_F(XmlEncoderTest, SkipsEmptyAttributes) {
  EXPECT_EQ(encode(R"({"r": {"@attributes": {"a": null, "b": "1"}}})"),
            "<r b=\"1\"></r>");
}

TEST_F(XmlEncoderTest, ArraysRepeatElements) {
  EXPECT_EQ(encode(R"({"Invoice": {"Line": [
                {"@attributes": {"n": "1"}, "@value": "a"},
                "b",
                null,
                {"Qty": 2}]}})"),
            "<Invoice><Line n=\"1\">a</Line><Line>b</Line>"
            "<Line><Qty>2</Qty></Line></Invoice>");
}

TEST_F(XmlEncoderTest, SanitizesText) {
  EXPECT_EQ(encode(R"({"r": {"a": "Tom & Jerry", "b": "Tom &amp; Jerry",
                            "c": "bell\u0007"}})"),
            "<r><a>Tom &amp; Jerry</a><b>Tom &amp; Jerry</b><c>bell</c></r>");
}

TEST_F(XmlEncoderTest, IgnoresAttributesAtDocumentLevel) {
  EXPECT_EQ(encode(R"({"@attributes": {"x": "1"}, "r": "v"})"), "<r>v</r>");
}

TEST_F(XmlEncoderTest, AppliesPrefixedNamespace) {
  EXPECT_EQ(encode(R"({"r": {"a": 1}})", XmlNamespace{"urn:x", "x"}),
            "<x:r xmlns:x=\"urn:x\"><x:a>1</x:a></x:r>");
}

TEST_F(XmlEncoderTest, AppliesDefaultNamespace) {
  EXPECT_EQ(encode(R"({"r": {"a": 1}})", XmlNamespace{"urn:d", ""}),
            "<r xmlns=\"urn:d\"><a>1</a></r>");
}

TEST_F(XmlEncoderTest, EncodesIntoExistingElement) {
  auto document = encoder.encode(Data::parse(R"({"r": {"a": "1"}})"));
  EXPECT_EQ(document->get("r.a"), Data("1"));

  encoder.encodeInto(Data::parse(R"({"b": "2"})"), *document, std::nullopt,
                     document->getDocumentElement());

  EXPECT_EQ(document->c14n(), "<r><a>1</a><b>2</b></r>");
  EXPECT_EQ(document->get("r.b"), Data("2"));
}

TEST_F(XmlEncoderTest, UsesDocumentSettings) {
  xmlkit::XmlDocument document("1.0", "UTF-8");
  document.setFormatOutput(false);
  encoder.encodeInto(Data::parse(R"({"r": "ñ"})"), document);
  EXPECT_EQ(document.getXml(), "<r>\xC3\xB1</r>");
}

TEST_F(XmlEncoderTest, RejectsNonObjectData) {
  EXPECT_THROW(encoder.encode(Data::array()), xmlkit::InvalidStructureError);
  EXPECT_THROW(encoder.encode(Data("text")), xmlkit::InvalidStructureError);
}

TEST_F(XmlEncoderTest, RejectsStructuredAttribute) {
  EXPECT_THROW(encode(R"({"r": {"@attributes": {"a": [1]}}})"),
               xmlkit::InvalidStructureError);
  EXPECT_THROW(encode(R"({"r": {"@attributes": {"a": {"b": 1}}}})"),
               xmlkit::InvalidStructureError);
}

TEST_F(XmlEncoderTest, RejectsNestedArrays) {
  try {
    encode(R"({"r": {"l": [[1, 2]]}})");
    FAIL() << "Expected InvalidStructureError";
  } catch (const xmlkit::InvalidStructureError& e) {
    EXPECT_NE(std::string(e.what()).find("\"l\""), std::string::npos);
  }
}

TEST_F(XmlEncoderTest, RejectsSecondRoot) {
  EXPECT_THROW(encode(R"({"a": "1", "b": "2"})"),
               xmlkit::InvalidStructureError);
  EXPECT_THROW(encode(R"({"a": ["1", "2"]})"), xmlkit::InvalidStructureError);
}

TEST_F(XmlEncoderTest, RejectsStructuredValue) {
  EXPECT_THROW(encode(R"({"r": {"@value": {"x": 1}}})"),
               xmlkit::InvalidStructureError);
}

TEST_F(XmlEncoderTest, DeclaresNamespacesFromAttributes) {
  auto document = encoder.encode(Data::parse(R"({"DTE": {"@attributes": {
      "xmlns": "http://www.sii.cl/SiiDte", "version": "1.0",
      "xmlns:xsi": "http://www.w3.org/2001/XMLSchema-instance",
      "xsi:schemaLocation": "http://www.sii.cl/SiiDte /tmp/DTE.xsd"},
      "Folio": "1"}})"));

  EXPECT_EQ(document->getNamespace(), "http://www.sii.cl/SiiDte");
  EXPECT_EQ(document->getSchema(), "/tmp/DTE.xsd");

  const std::string expected =
      "<DTE xmlns=\"http://www.sii.cl/SiiDte\" "
      "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\" version=\"1.0\" "
      "xsi:schemaLocation=\"http://www.sii.cl/SiiDte /tmp/DTE.xsd\">"
      "<Folio>1</Folio></DTE>";
  EXPECT_EQ(document->c14n(), expected);

  document->setFormatOutput(false);
  xmlkit::XmlDocument reloaded;
  reloaded.loadXml(document->saveXml());
  EXPECT_EQ(reloaded.c14n(), expected);
}

TEST_F(XmlEncoderTest, ResolvesPrefixesRegardlessOfKeyOrder) {
  auto document = encoder.encode(Data::parse(R"({"r": {"a": "1",
      "@attributes": {"p:at": "v", "xmlns:p": "urn:p", "xmlns": "urn:d"}}})"));

  // Дочерний узел объявлен раньше атрибутов, но попадает в пространство
  // по умолчанию, как после повторного разбора
  xmlNodePtr child = document->getDocumentElement()->children;
  ASSERT_NE(child->ns, nullptr);
  EXPECT_STREQ(reinterpret_cast<const char*>(child->ns->href), "urn:d");
  EXPECT_EQ(document->c14n(),
            "<r xmlns=\"urn:d\" xmlns:p=\"urn:p\" p:at=\"v\"><a>1</a></r>");
}
