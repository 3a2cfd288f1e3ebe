#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

#include "skillpack/skillpack.hpp"
#include "test_util.hpp"

using namespace skillpack;
using skillpack::testing::EnvGuard;
using skillpack::testing::TempDir;
using skillpack::testing::write_skill;

namespace fs = std::filesystem;

class SkillpackInitTest : public ::testing::Test {
 protected:
  TempDir project_{"skillpack-init-project"};
  TempDir home_{"skillpack-init-home"};
  EnvGuard home_guard_{"HOME", home_.path().string()};
  std::shared_ptr<spdlog::logger> previous_ = spdlog::default_logger();

  void TearDown() override {
    skillpack::shutdown();
    spdlog::drop("skillpack");
    spdlog::set_default_logger(previous_);
  }
};

TEST_F(SkillpackInitTest, InitLoadsSkillsAndTools) {
  write_skill(project_.path() / ".claude" / "skills" / "demo", "demo", "Demo skill");
  write_skill(home_.path() / ".skillpack" / "skills" / "personal", "personal", "Home skill");

  Config config;
  config.working_dir = project_.path();
  config.log_file = home_.path() / "logs" / "skillpack.log";
  config.log_level = "debug";

  auto& registry = skillpack::init(config);
  EXPECT_EQ(&registry, &skill::SkillRegistry::instance());
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_EQ(registry.get("demo")->location(), SkillLocation::Project);
  EXPECT_EQ(registry.get("personal")->location(), SkillLocation::User);

  auto tool = ToolRegistry::instance().get("skill");
  ASSERT_NE(tool, nullptr);
  EXPECT_NE(tool->description().find("<name>demo</name>"), std::string::npos);

  // Logging honors log_file and log_level
  EXPECT_TRUE(fs::exists(*config.log_file));
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST_F(SkillpackInitTest, CatalogBudgetReachesSkillTool) {
  write_skill(project_.path() / ".claude" / "skills" / "demo", "demo", "Demo skill");

  Config config;
  config.working_dir = project_.path();
  config.log_file = home_.path() / "skillpack.log";
  config.catalog_char_budget = 10;

  skillpack::init(config);
  auto tool = ToolRegistry::instance().get("skill");
  ASSERT_NE(tool, nullptr);
  EXPECT_EQ(tool->description().find("<name>demo</name>"), std::string::npos);
}

TEST_F(SkillpackInitTest, ShutdownClearsState) {
  write_skill(project_.path() / ".claude" / "skills" / "demo", "demo", "Demo skill");

  Config config;
  config.working_dir = project_.path();
  config.log_file = home_.path() / "skillpack.log";
  skillpack::init(config);

  skillpack::shutdown();
  EXPECT_TRUE(skill::SkillRegistry::instance().empty());
  EXPECT_EQ(ToolRegistry::instance().get("skill"), nullptr);
}

TEST(SkillpackVersionTest, Version) {
  auto v = skillpack::version();
  EXPECT_FALSE(v.empty());
  EXPECT_EQ(std::count(v.begin(), v.end(), '.'), 2);
}

TEST(SkillLocationTest, StringForms) {
  EXPECT_EQ(to_string(SkillLocation::Project), "project");
  EXPECT_EQ(to_string(SkillLocation::User), "user");
  EXPECT_EQ(skill_location_from_string("project").value_or(SkillLocation::User), SkillLocation::Project);
  EXPECT_EQ(skill_location_from_string("user").value_or(SkillLocation::Project), SkillLocation::User);
  EXPECT_FALSE(skill_location_from_string("Project").has_value());
  EXPECT_FALSE(skill_location_from_string("").has_value());

  EXPECT_TRUE(has_priority_over(SkillLocation::Project, SkillLocation::User));
  EXPECT_FALSE(has_priority_over(SkillLocation::User, SkillLocation::Project));
  EXPECT_FALSE(has_priority_over(SkillLocation::User, SkillLocation::User));
}
