#include "workgraph/cli/session.hpp"
#include "workgraph/config/config.hpp"

#include <gtest/gtest.h>

#include "test_utils.hpp"

using namespace workgraph;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.store.backend, StoreBackend::Json);
  EXPECT_EQ(config.store.path, "tasks/tasks.json");
  EXPECT_TRUE(config.store.tag.empty());
  EXPECT_EQ(config.log.level, "info");
  EXPECT_EQ(config.bulk.max_range_size, kDefaultMaxRangeSize);
}

TEST(ConfigTest, LoadFullConfig) {
  auto result = ConfigLoader::load_from_string(R"(
store:
  backend: sqlite
  path: /var/lib/workgraph/tasks.db
  tag: master
log:
  level: debug
  color: false
bulk:
  max_range_size: 250
)");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.backend, StoreBackend::Sqlite);
  EXPECT_EQ(result->store.path, "/var/lib/workgraph/tasks.db");
  EXPECT_EQ(result->store.tag, "master");
  EXPECT_EQ(result->log.level, "debug");
  EXPECT_FALSE(result->log.color);
  EXPECT_EQ(result->bulk.max_range_size, 250u);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
  auto result = ConfigLoader::load_from_string("log:\n  level: warn\n");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.backend, StoreBackend::Json);
  EXPECT_EQ(result->store.path, "tasks/tasks.json");
  EXPECT_EQ(result->log.level, "warn");
  EXPECT_EQ(result->bulk.max_range_size, kDefaultMaxRangeSize);
}

TEST(ConfigTest, EmptyDocumentUsesDefaults) {
  auto result = ConfigLoader::load_from_string("");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.backend, StoreBackend::Json);
}

TEST(ConfigTest, UnknownBackendIsInvalidArgument) {
  auto result = ConfigLoader::load_from_string("store:\n  backend: redis\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, ZeroRangeSizeIsInvalidArgument) {
  auto result =
      ConfigLoader::load_from_string("bulk:\n  max_range_size: 0\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto result = ConfigLoader::load_from_string("store: [unclosed\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, WrongValueTypeIsParseError) {
  auto result =
      ConfigLoader::load_from_string("bulk:\n  max_range_size: lots\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, MissingFileIsFileNotFound) {
  auto result =
      ConfigLoader::load_from_file("/tmp/workgraph_test_missing_config.yaml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST(ConfigTest, LoadFromFile) {
  test::TempPath file(".yaml");
  file.write("store:\n  backend: sqlite\n  path: tasks.db\n");

  auto result = ConfigLoader::load_from_file(file.str());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.backend, StoreBackend::Sqlite);
  EXPECT_EQ(result->store.path, "tasks.db");
}

TEST(ConfigTest, ToStringLoadsBack) {
  SystemConfig config;
  config.store.backend = StoreBackend::Sqlite;
  config.store.tag = "feature";
  config.bulk.max_range_size = 64;

  auto result = ConfigLoader::load_from_string(ConfigLoader::to_string(config));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.backend, StoreBackend::Sqlite);
  EXPECT_EQ(result->store.tag, "feature");
  EXPECT_EQ(result->bulk.max_range_size, 64u);
}

TEST(ConfigTest, CommandLineOverridesFile) {
  test::TempPath file(".yaml");
  file.write("store:\n  backend: json\n  path: a.json\nlog:\n  level: warn\n");

  cli::CommonOptions common;
  common.config_file = file.str();
  common.backend = StoreBackend::Sqlite;
  common.store_path = "b.db";

  auto result = cli::resolve_config(common);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.backend, StoreBackend::Sqlite);
  EXPECT_EQ(result->store.path, "b.db");
  EXPECT_EQ(result->log.level, "warn");
}

TEST(ConfigTest, BackendNames) {
  EXPECT_EQ(string_to_store_backend("json"), StoreBackend::Json);
  EXPECT_EQ(string_to_store_backend("sqlite"), StoreBackend::Sqlite);
  EXPECT_FALSE(string_to_store_backend("mysql").has_value());
  EXPECT_EQ(store_backend_to_string(StoreBackend::Sqlite), "sqlite");
}
