#include "workgraph/util/log.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

using namespace workgraph;

namespace {

auto drain(std::FILE* file) -> std::string {
  std::fflush(file);
  std::rewind(file);
  std::string out;
  char buf[256];
  while (auto n = std::fread(buf, 1, sizeof(buf), file)) {
    out.append(buf, n);
  }
  return out;
}

}  // namespace

TEST(LogTest, LineCarriesTimestampAndLevel) {
  std::FILE* file = std::tmpfile();
  ASSERT_NE(file, nullptr);

  log::Logger logger;
  logger.set_color(false);
  logger.set_output(file);
  logger.log(log::Level::Warn, "task {} skipped", 7);

  auto out = drain(file);
  std::fclose(file);

  // "[YYYY-MM-DD HH:MM:SS] [warn] task 7 skipped"
  ASSERT_GE(out.size(), 22u);
  EXPECT_EQ(out[0], '[');
  EXPECT_EQ(out[5], '-');
  EXPECT_EQ(out[8], '-');
  EXPECT_EQ(out[11], ' ');
  EXPECT_EQ(out[14], ':');
  EXPECT_EQ(out[17], ':');
  EXPECT_EQ(out[20], ']');
  EXPECT_NE(out.find("] [warn] task 7 skipped\n"), std::string::npos) << out;
}

TEST(LogTest, BelowThresholdDropped) {
  std::FILE* file = std::tmpfile();
  ASSERT_NE(file, nullptr);

  log::Logger logger;
  logger.set_color(false);
  logger.set_output(file);
  logger.set_level(log::Level::Info);
  logger.log(log::Level::Debug, "hidden");
  logger.log(log::Level::Error, "shown");

  auto out = drain(file);
  std::fclose(file);

  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("[error] shown"), std::string::npos) << out;
}
