#include <gtest/gtest.h>

#include <string>

#include "xmlkit/encodingtranscoder.hpp"
#include "xmlkit/xmlexception.hpp"

using xmlkit::EncodingTranscoder;

TEST(EncodingTranscoderTest, ConvertsUtf8ToLatin1AndBack) {
  const std::string utf8 = "A\xC3\xB1o";
  const std::string latin1 = "A\xF1o";

  EXPECT_EQ(EncodingTranscoder::fromUtf8(utf8, "ISO-8859-1"), latin1);
  EXPECT_EQ(EncodingTranscoder::toUtf8(latin1, "ISO-8859-1"), utf8);
  EXPECT_EQ(EncodingTranscoder::convert(utf8, "utf-8", "iso-8859-1"), latin1);
}

TEST(EncodingTranscoderTest, SubstitutesUnrepresentableCharacters) {
  // U+20AC (euro) не входит в ISO-8859-1
  const std::string utf8 = "a\xE2\x82\xAC" "b";
  EXPECT_EQ(EncodingTranscoder::fromUtf8(utf8, "ISO-8859-1"), "a?b");
}

TEST(EncodingTranscoderTest, SameEncodingIsNoOp) {
  const std::string text = "caf\xC3\xA9";
  EXPECT_EQ(EncodingTranscoder::convert(text, "UTF-8", "utf8"), text);
  EXPECT_EQ(EncodingTranscoder::fromUtf8(text, "UTF-8"), text);
  EXPECT_EQ(EncodingTranscoder::fromUtf8("", "ISO-8859-1"), "");
}

TEST(EncodingTranscoderTest, NormalizesNames) {
  EXPECT_EQ(EncodingTranscoder::normalizeName("iso-8859-1"), "ISO-8859-1");
  EXPECT_TRUE(EncodingTranscoder::isUtf8("utf8"));
  EXPECT_TRUE(EncodingTranscoder::isUtf8("Utf-8"));
  EXPECT_FALSE(EncodingTranscoder::isUtf8("ISO-8859-1"));
}

TEST(EncodingTranscoderTest, UnknownEncodingThrows) {
  EXPECT_THROW(EncodingTranscoder::fromUtf8("abc", "NO-SUCH-ENCODING"),
               xmlkit::XmlException);
}

TEST(EncodingTranscoderPrepareTest, AddsMissingDeclaration) {
  EXPECT_EQ(EncodingTranscoder::prepareForLoad("<a/>", "ISO-8859-1"),
            "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?>\n<a/>");
  EXPECT_EQ(EncodingTranscoder::prepareForLoad("<a/>", "utf-8"),
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<a/>");
}

TEST(EncodingTranscoderPrepareTest, TranscodesUtf8Source) {
  const std::string source =
      "<?xml version=\"1.0\" encoding=\"utf-8\"?><a>\xC3\xB1</a>";
  EXPECT_EQ(EncodingTranscoder::prepareForLoad(source, "ISO-8859-1"),
            "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><a>\xF1</a>");
}

TEST(EncodingTranscoderPrepareTest, RebuiltDeclarationKeepsVersion) {
  const std::string source =
      "<?xml version=\"1.1\" encoding=\"UTF-8\"?><a>\xC3\xA9</a>";
  EXPECT_EQ(EncodingTranscoder::prepareForLoad(source, "ISO-8859-1"),
            "<?xml version=\"1.1\" encoding=\"ISO-8859-1\"?><a>\xE9</a>");
}

TEST(EncodingTranscoderPrepareTest, KeepsMatchingDeclaration) {
  const std::string source =
      "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><a>\xF1</a>";
  EXPECT_EQ(EncodingTranscoder::prepareForLoad(source, "ISO-8859-1"), source);

  const std::string utf8 =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?><a>\xC3\xB1</a>";
  EXPECT_EQ(EncodingTranscoder::prepareForLoad(utf8, "UTF-8"), utf8);
}
