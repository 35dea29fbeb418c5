#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../include/argumentparser.hpp"

namespace {

ParsedArgs parseArgs(std::vector<std::string> values) {
  values.insert(values.begin(), "xmlkit");
  std::vector<char *> argv;
  for (auto &value : values) argv.push_back(value.data());
  ArgumentParser parser;
  return parser.parse(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(ArgumentParserTest, ParsesCommandAndPositionals) {
  const ParsedArgs args = parseArgs({"query", "in.xml", "/r/a"});
  EXPECT_EQ(args.command, "query");
  ASSERT_EQ(args.positional.size(), 2u);
  EXPECT_EQ(args.positional[1], "/r/a");
  EXPECT_FALSE(args.config_path.has_value());
  EXPECT_FALSE(args.flatten);
}

TEST(ArgumentParserTest, AcceptsBothValueForms) {
  const ParsedArgs args = parseArgs({"--config-file=conf.json", "--log-level",
                                     "debug", "c14n", "in.xml", "--xpath",
                                     "/r/a", "--flatten"});
  EXPECT_EQ(args.config_path, "conf.json");
  EXPECT_EQ(args.log_level, "debug");
  EXPECT_EQ(args.xpath, "/r/a");
  EXPECT_TRUE(args.flatten);
}

TEST(ArgumentParserTest, ParsesNamespaceOption) {
  ParsedArgs args = parseArgs({"encode", "d.json", "--namespace=urn:x,x"});
  EXPECT_EQ(args.namespace_uri, "urn:x");
  EXPECT_EQ(args.namespace_prefix, "x");

  args = parseArgs({"encode", "d.json", "--namespace", "urn:d"});
  EXPECT_EQ(args.namespace_uri, "urn:d");
  EXPECT_EQ(args.namespace_prefix, "");
}

TEST(ArgumentParserTest, CollectsQueryParametersAndPrefixes) {
  const ParsedArgs args =
      parseArgs({"query", "in.xml", "//i[@id=:id]", "--param=id=5",
                 "--param", "name=a=b", "--ns=ds=urn:ds"});
  ASSERT_EQ(args.params.size(), 2u);
  EXPECT_EQ(args.params[0], std::make_pair(std::string("id"), std::string("5")));
  EXPECT_EQ(args.params[1].second, "a=b");
  EXPECT_EQ(args.namespaces.at("ds"), "urn:ds");
}

TEST(ArgumentParserTest, HelpSkipsCommandValidation) {
  const ParsedArgs args = parseArgs({"--help"});
  EXPECT_TRUE(args.help_message);
  EXPECT_TRUE(parseArgs({"-h", "bogus"}).help_message);
}

TEST(ArgumentParserTest, RejectsInvalidInput) {
  EXPECT_THROW(parseArgs({}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"transform", "a.xml"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"decode"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"decode", "a.xml", "b.xml"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"decode", "a.xml", "--verbose"}),
               std::invalid_argument);
  EXPECT_THROW(parseArgs({"decode", "a.xml", "--log-level=loud"}),
               std::invalid_argument);
  EXPECT_THROW(parseArgs({"decode", "a.xml", "--schema"}),
               std::invalid_argument);
  EXPECT_THROW(parseArgs({"query", "a.xml", "/r", "--param=novalue"}),
               std::invalid_argument);
  EXPECT_THROW(parseArgs({"encode", "d.json", "--namespace=,x"}),
               std::invalid_argument);
}
