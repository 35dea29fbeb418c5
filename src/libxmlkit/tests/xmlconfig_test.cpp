#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "xmlkit/configloader.hpp"
#include "xmlkit/xmlconfig.hpp"

namespace fs = std::filesystem;

using xmlkit::XmlConfig;

TEST(XmlConfigTest, DefaultsWithoutSections) {
  const XmlConfig config = XmlConfig::fromJson(nlohmann::ordered_json::object());
  EXPECT_EQ(config.version, "1.0");
  EXPECT_EQ(config.encoding, "ISO-8859-1");
  EXPECT_TRUE(config.formatOutput);
  EXPECT_EQ(config.logLevel, xmlkit::LogLevel::LOG_INFO);
  EXPECT_TRUE(config.namespaces.empty());
  EXPECT_TRUE(config.translations.empty());
}

TEST(XmlConfigTest, ReadsAllSections) {
  const auto json = nlohmann::ordered_json::parse(R"({
    "document": {"version": "1.1", "encoding": "UTF-8", "format_output": false},
    "logging": {"level": "debug"},
    "query": {"namespaces": {"ds": "http://www.w3.org/2000/09/xmldsig#"}},
    "validator": {"translations": {"Element": "Campo", "Field": "Dato"}}
  })");

  const XmlConfig config = XmlConfig::fromJson(json);
  EXPECT_EQ(config.version, "1.1");
  EXPECT_EQ(config.encoding, "UTF-8");
  EXPECT_FALSE(config.formatOutput);
  EXPECT_EQ(config.logLevel, xmlkit::LogLevel::LOG_DEBUG);
  EXPECT_EQ(config.namespaces.at("ds"), "http://www.w3.org/2000/09/xmldsig#");
  ASSERT_EQ(config.translations.size(), 2u);
  EXPECT_EQ(config.translations[0].first, "Element");
  EXPECT_EQ(config.translations[1].second, "Dato");
}

TEST(XmlConfigTest, RejectsWrongTypes) {
  using nlohmann::ordered_json;
  EXPECT_THROW(XmlConfig::fromJson(ordered_json::array()), std::runtime_error);
  EXPECT_THROW(XmlConfig::fromJson(ordered_json::parse(R"({"document": 1})")),
               std::runtime_error);
  EXPECT_THROW(XmlConfig::fromJson(ordered_json::parse(
                   R"({"document": {"format_output": "yes"}})")),
               std::runtime_error);
  EXPECT_THROW(XmlConfig::fromJson(ordered_json::parse(
                   R"({"query": {"namespaces": {"ds": 1}}})")),
               std::runtime_error);
  EXPECT_THROW(XmlConfig::fromJson(ordered_json::parse(
                   R"({"logging": {"level": "loud"}})")),
               std::invalid_argument);
}

TEST(XmlConfigTest, CreatesConfiguredDocument) {
  XmlConfig config;
  config.encoding = "utf-8";
  config.formatOutput = false;

  auto document = config.createDocument();
  EXPECT_EQ(document->encoding(), "UTF-8");
  EXPECT_FALSE(document->formatOutput());
}

class ConfigLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = fs::temp_directory_path() /
            ("xmlkit_config_" +
             std::to_string(
                 std::chrono::system_clock::now().time_since_epoch().count()) +
             ".json");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  void write(const std::string& content) { std::ofstream(path_) << content; }

  fs::path path_;
  xmlkit::ConfigLoader loader_;
};

TEST_F(ConfigLoaderTest, LoadsFileKeepingKeyOrder) {
  write(R"({"validator": {"translations": {"z": "1", "a": "2"}}})");

  const auto config = loader_.loadFromFile(path_.string());
  EXPECT_TRUE(loader_.hasLoadedFile());
  EXPECT_EQ(loader_.getLastLoadedFile(), path_.string());

  const auto& translations = config["validator"]["translations"];
  EXPECT_EQ(translations.begin().key(), "z");
}

TEST_F(ConfigLoaderTest, ReportsErrors) {
  EXPECT_THROW(loader_.loadFromFile(""), std::invalid_argument);
  EXPECT_THROW(loader_.loadFromFile(path_.string()), std::runtime_error);

  write("{ not json");
  try {
    loader_.loadFromFile(path_.string());
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("JSON parse error"),
              std::string::npos);
  }
  EXPECT_FALSE(loader_.hasLoadedFile());
}
