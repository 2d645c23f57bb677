#include "driver.hpp"
#include "test_utils.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

static size_t count_lines(const std::string& s) {
  size_t n = 0;
  for (char c : s)
    if (c == '\n') n++;
  return n;
}

TEST(DriverTests, ScansBuiltInSample) {
  std::ostringstream out, err;
  tilescript::DriverOptions opts;
  int rc = tilescript::scan_source("<sample>", tilescript::sample_source(), out, err, opts);
  EXPECT_EQ(rc, 0) << err.str();
  EXPECT_TRUE(err.str().empty());
  std::string text = out.str();
  EXPECT_EQ(text.substr(0, text.find('\n')), "IDENTIFIER on line 1 in pos 1-4 pub null");
  EXPECT_NE(text.find("DOUBLE on line 2 in pos"), std::string::npos);
  EXPECT_NE(text.find(" \"nya\" nya\n"), std::string::npos) << text;
  EXPECT_NE(text.find("\nEOF on line 6 in pos"), std::string::npos) << text;
}

TEST(DriverTests, PrintsDiagnosticOnFailure) {
  std::ostringstream out, err;
  tilescript::DriverOptions opts;
  int rc = tilescript::scan_source("inline", "1.2.3", out, err, opts);
  EXPECT_EQ(rc, 1);
  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(err.str(),
            "UnexpectedSymbol at 1:4\n"
            "    1| 1.2.3\n"
            "          ^\n");
}

TEST(DriverTests, ScansDataFile) {
  std::ostringstream out, err;
  tilescript::DriverOptions opts;
  std::string path = std::string(tilescript::test::test_data_dir()) + "/level.tile";
  int rc = tilescript::scan_file(path, out, err, opts);
  EXPECT_EQ(rc, 0) << err.str();
  EXPECT_EQ(count_lines(out.str()), 36u);
}

TEST(DriverTests, ReportsMissingFile) {
  std::ostringstream out, err;
  tilescript::DriverOptions opts;
  int rc = tilescript::scan_file("/nonexistent/room.tile", out, err, opts);
  EXPECT_EQ(rc, 1);
  EXPECT_EQ(err.str(), "tilescript: cannot open '/nonexistent/room.tile'\n");
}

TEST(DriverTests, DebugTracesToErr) {
  std::ostringstream out, err;
  tilescript::DriverOptions opts;
  opts.debug = true;
  int rc = tilescript::scan_source("inline", "a b", out, err, opts);
  EXPECT_EQ(rc, 0);
  EXPECT_NE(err.str().find("tilescript: scanning inline (3 bytes)"), std::string::npos);
  EXPECT_NE(err.str().find("tilescript: 3 tokens"), std::string::npos);
}
