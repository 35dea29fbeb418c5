#include <gtest/gtest.h>

#include <string>

#include "xmlkit/xmlexception.hpp"
#include "xmlkit/xmlhelper.hpp"

using xmlkit::XmlHelper;

TEST(XmlHelperSanitizeTest, LeavesEmptyAndNumericValuesUntouched) {
  EXPECT_EQ(XmlHelper::sanitize(""), "");
  EXPECT_EQ(XmlHelper::sanitize("123"), "123");
  EXPECT_EQ(XmlHelper::sanitize("-12.50"), "-12.50");
}

TEST(XmlHelperSanitizeTest, StripsControlCharacters) {
  EXPECT_EQ(XmlHelper::sanitize(std::string("bell\x07") + "end"), "bellend");
  EXPECT_EQ(XmlHelper::sanitize("line\nbreak\ttab"), "linebreaktab");
  EXPECT_EQ(XmlHelper::sanitize(std::string("del\x7f")), "del");
}

TEST(XmlHelperSanitizeTest, EscapesAmpersandOnce) {
  EXPECT_EQ(XmlHelper::sanitize("Tom & Jerry"), "Tom &amp; Jerry");
  EXPECT_EQ(XmlHelper::sanitize("Tom &amp; Jerry"), "Tom &amp; Jerry");
  EXPECT_EQ(XmlHelper::sanitize("Tom &#38; Jerry"), "Tom &amp; Jerry");
}

TEST(XmlHelperSanitizeTest, UnescapesOtherPredefinedEntities) {
  EXPECT_EQ(XmlHelper::sanitize("&lt;b&gt;"), "<b>");
  EXPECT_EQ(XmlHelper::sanitize("&#60;b&#62;"), "<b>");
  EXPECT_EQ(XmlHelper::sanitize("&quot;q&quot; &apos;a&apos;"), "\"q\" 'a'");
  EXPECT_EQ(XmlHelper::sanitize("&#34;q&#34; &#39;a&#39;"), "\"q\" 'a'");
}

TEST(XmlHelperFixEntitiesTest, ReplacesQuotesInTextOnly) {
  const std::string xml = "<a attr=\"it's\" other='say \"hi\"'>Tom's \"x\"</a>";
  EXPECT_EQ(XmlHelper::fixEntities(xml),
            "<a attr=\"it's\" other='say \"hi\"'>Tom&apos;s &quot;x&quot;</a>");
}

TEST(XmlHelperFixEntitiesTest, KeepsDeclarationIntact) {
  const std::string xml =
      "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?>\n<r><a>'</a></r>";
  EXPECT_EQ(XmlHelper::fixEntities(xml),
            "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?>\n"
            "<r><a>&apos;</a></r>");
}

TEST(XmlHelperFixEntitiesTest, IsIdempotent) {
  const std::string fixed =
      XmlHelper::fixEntities("<r n=\"1\"><a>it's \"quoted\"</a></r>");
  EXPECT_EQ(XmlHelper::fixEntities(fixed), fixed);
}

TEST(XmlHelperFixEntitiesTest, ToleratesMalformedInput) {
  EXPECT_EQ(XmlHelper::fixEntities("no tags ' here"), "no tags ' here");
  EXPECT_EQ(XmlHelper::fixEntities("<a>'"), "<a>&apos;");
  EXPECT_EQ(XmlHelper::fixEntities(""), "");
}

TEST(XmlHelperIsNumericTest, RecognizesNumbers) {
  EXPECT_TRUE(XmlHelper::isNumeric("42"));
  EXPECT_TRUE(XmlHelper::isNumeric(" -1.5 "));
  EXPECT_TRUE(XmlHelper::isNumeric("1e3"));
  EXPECT_TRUE(XmlHelper::isNumeric(".5"));
  EXPECT_FALSE(XmlHelper::isNumeric("1e"));
  EXPECT_FALSE(XmlHelper::isNumeric("12a"));
  EXPECT_FALSE(XmlHelper::isNumeric("."));
  EXPECT_FALSE(XmlHelper::isNumeric(""));
}

TEST(XmlHelperXPathTest, QueriesXmlString) {
  auto nodes = XmlHelper::xpath(std::string("<r><i>1</i><i>2</i></r>"), "/r/i");
  ASSERT_EQ(nodes.size(), 2u);
  EXPECT_STREQ(reinterpret_cast<const char*>(nodes.item(0)->name), "i");
  EXPECT_EQ(nodes.item(2), nullptr);
}

TEST(XmlHelperXPathTest, NonNodeSetResultIsEmpty) {
  auto nodes = XmlHelper::xpath(std::string("<r><i>1</i></r>"), "count(/r/i)");
  EXPECT_TRUE(nodes.empty());
}

TEST(XmlHelperXPathTest, ReportsErrors) {
  EXPECT_THROW(XmlHelper::xpath(std::string("<r>"), "/r"),
               xmlkit::InvalidXmlError);
  EXPECT_THROW(XmlHelper::xpath(std::string("<r/>"), "/r/["),
               xmlkit::InvalidXPathError);
}
