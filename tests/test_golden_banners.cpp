#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include "banner_formatter.hpp"

// Runs from the source root (see WORKING_DIRECTORY in CMakeLists.txt).
TEST(GoldenBanners, MatchTestcases) {
  const std::string path = "tests/testcases/banners.yaml";
  YAML::Node cases = YAML::LoadFile(path);
  ASSERT_TRUE(cases.IsSequence());
  ASSERT_GT(cases.size(), 0u);

  for (const auto& c : cases) {
    const std::string name = c["name"].as<std::string>();
    SCOPED_TRACE(name);

    tb::BannerParameters p;
    p.width = c["width"].as<int>();
    if (c["rank"]) p.rank = c["rank"].as<int>();
    if (c["pad"]) p.pad = c["pad"].as<int>();
    if (c["marker"]) p.marker = c["marker"].as<std::string>().at(0);
    const std::string title = c["title"].as<std::string>();

    if (c["error"]) {
      ASSERT_EQ(c["error"].as<std::string>(), "fit");
      try {
        tb::format_banner(title, p);
        ADD_FAILURE() << "expected FitError";
      } catch (const tb::BannerError& e) {
        EXPECT_EQ(e.code(), tb::BannerErrc::FitError);
      }
      continue;
    }

    auto expected = c["lines"].as<std::vector<std::string>>();
    EXPECT_EQ(tb::format_banner(title, p), expected);
  }
}
