#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>

#include "skillpack/skill/registry.hpp"

using namespace skillpack;
using namespace skillpack::skill;

namespace {

Skill make_skill(const std::string& name, const std::string& description, SkillLocation location, const std::string& path = "/tmp") {
  return *Skill::create(name, description, "Content", path, location);
}

const size_t kWrapperSize = std::strlen(CATALOG_OPEN_TAG) + std::strlen(CATALOG_CLOSE_TAG);

}  // namespace

// ============================================================================
// Registration and priority
// ============================================================================

class SkillRegistryTest : public ::testing::Test {
 protected:
  SkillRegistry registry_;
};

TEST_F(SkillRegistryTest, RegisterAndGet) {
  EXPECT_TRUE(registry_.register_skill(make_skill("test", "Test skill", SkillLocation::Project)));

  auto skill = registry_.get("test");
  ASSERT_TRUE(skill.has_value());
  EXPECT_EQ(skill->description(), "Test skill");
  EXPECT_TRUE(registry_.exists("test"));
  EXPECT_FALSE(registry_.exists("missing"));
  EXPECT_FALSE(registry_.get("missing").has_value());
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(SkillRegistryTest, ProjectOverridesUser) {
  EXPECT_TRUE(registry_.register_skill(make_skill("same-name", "User version", SkillLocation::User, "/home/user")));
  EXPECT_TRUE(registry_.register_skill(make_skill("same-name", "Project version", SkillLocation::Project, "/project")));

  auto retrieved = registry_.get("same-name");
  ASSERT_TRUE(retrieved);
  EXPECT_EQ(retrieved->description(), "Project version");
  EXPECT_EQ(retrieved->location(), SkillLocation::Project);
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(SkillRegistryTest, UserDoesNotOverrideProject) {
  EXPECT_TRUE(registry_.register_skill(make_skill("same-name", "Project version", SkillLocation::Project, "/project")));
  EXPECT_FALSE(registry_.register_skill(make_skill("same-name", "User version", SkillLocation::User, "/home/user")));

  auto retrieved = registry_.get("same-name");
  ASSERT_TRUE(retrieved);
  EXPECT_EQ(retrieved->description(), "Project version");
}

TEST_F(SkillRegistryTest, SameTierIsRejected) {
  for (auto location : {SkillLocation::Project, SkillLocation::User}) {
    SkillRegistry registry;
    EXPECT_TRUE(registry.register_skill(make_skill("dup", "first", location)));
    EXPECT_FALSE(registry.register_skill(make_skill("dup", "second", location)));
    EXPECT_EQ(registry.get("dup")->description(), "first");
  }
}

TEST_F(SkillRegistryTest, RegistrationIsCommutative) {
  auto user = make_skill("same-name", "User version", SkillLocation::User);
  auto project = make_skill("same-name", "Project version", SkillLocation::Project);

  SkillRegistry forward;
  forward.register_skill(user);
  forward.register_skill(project);

  SkillRegistry backward;
  backward.register_skill(project);
  backward.register_skill(user);

  EXPECT_EQ(forward.get("same-name")->description(), "Project version");
  EXPECT_EQ(backward.get("same-name")->description(), "Project version");
  EXPECT_EQ(forward.generate_catalog(10000), backward.generate_catalog(10000));
}

TEST_F(SkillRegistryTest, OverrideKeepsPosition) {
  registry_.register_skill(make_skill("a", "A", SkillLocation::User));
  registry_.register_skill(make_skill("b", "B", SkillLocation::User));
  registry_.register_skill(make_skill("c", "C", SkillLocation::User));
  registry_.register_skill(make_skill("b", "B project", SkillLocation::Project));

  auto all = registry_.all();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].name(), "a");
  EXPECT_EQ(all[1].name(), "b");
  EXPECT_EQ(all[1].description(), "B project");
  EXPECT_EQ(all[2].name(), "c");
}

TEST_F(SkillRegistryTest, ListAll) {
  for (int i = 0; i < 3; i++) {
    registry_.register_skill(make_skill("skill-" + std::to_string(i), "Skill " + std::to_string(i), SkillLocation::Project));
  }

  auto all = registry_.all();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].name(), "skill-0");
  EXPECT_EQ(all[2].name(), "skill-2");
}

TEST_F(SkillRegistryTest, Clear) {
  registry_.register_skill(make_skill("x", "X", SkillLocation::User));
  registry_.clear();
  EXPECT_TRUE(registry_.empty());
  EXPECT_FALSE(registry_.exists("x"));
  EXPECT_TRUE(registry_.register_skill(make_skill("x", "X again", SkillLocation::User)));
}

TEST(SkillRegistryInstanceTest, ResetClearsDefaultRegistry) {
  SkillRegistry::instance().register_skill(make_skill("global", "G", SkillLocation::User));
  EXPECT_TRUE(SkillRegistry::instance().exists("global"));

  reset_skill_registry();
  EXPECT_TRUE(SkillRegistry::instance().empty());
}

// ============================================================================
// Catalog generation
// ============================================================================

TEST_F(SkillRegistryTest, CatalogContainsFragments) {
  registry_.register_skill(make_skill("prompt-test", "Test prompt generation", SkillLocation::Project));

  auto catalog = registry_.generate_catalog(15000);
  EXPECT_EQ(catalog.rfind(CATALOG_OPEN_TAG, 0), 0u);
  EXPECT_NE(catalog.find("<name>prompt-test</name>"), std::string::npos);
  EXPECT_NE(catalog.find("<location>project</location>"), std::string::npos);
  EXPECT_EQ(catalog.substr(catalog.size() - std::strlen(CATALOG_CLOSE_TAG)), CATALOG_CLOSE_TAG);
}

TEST_F(SkillRegistryTest, EmptyCatalogIsWellFormed) {
  EXPECT_EQ(registry_.generate_catalog(15000), std::string(CATALOG_OPEN_TAG) + CATALOG_CLOSE_TAG);
}

TEST_F(SkillRegistryTest, CatalogRespectsBudget) {
  std::string long_description;
  for (int i = 0; i < 50; i++) long_description += "A ";

  for (int i = 0; i < 300; i++) {
    char name[16];
    std::snprintf(name, sizeof(name), "skill-%03d", i);
    registry_.register_skill(make_skill(name, long_description, SkillLocation::Project));
  }

  for (size_t budget : {0u, 10u, 100u, 500u, 1000u, 5000u, 20000u}) {
    auto catalog = registry_.generate_catalog(budget);
    EXPECT_LE(catalog.size(), std::max(budget, kWrapperSize)) << "budget " << budget;
    EXPECT_EQ(catalog.rfind(CATALOG_OPEN_TAG, 0), 0u);
    EXPECT_EQ(catalog.substr(catalog.size() - std::strlen(CATALOG_CLOSE_TAG)), CATALOG_CLOSE_TAG);
  }

  auto small = registry_.generate_catalog(500);
  EXPECT_LT(small.size(), 1000u);
  EXPECT_NE(small.find("skill-000"), std::string::npos);
  EXPECT_EQ(small.find("skill-299"), std::string::npos);
}

TEST_F(SkillRegistryTest, CatalogBudgetBoundaries) {
  auto first = make_skill("first", "First skill", SkillLocation::Project);
  auto second = make_skill("second", "Second skill", SkillLocation::Project);
  registry_.register_skill(first);
  registry_.register_skill(second);

  const size_t one_fragment = kWrapperSize + first.to_summary_fragment().size();

  // Exactly one fragment plus the wrapper fits
  auto exact = registry_.generate_catalog(one_fragment);
  EXPECT_EQ(exact.size(), one_fragment);
  EXPECT_NE(exact.find("<name>first</name>"), std::string::npos);
  EXPECT_EQ(exact.find("<name>second</name>"), std::string::npos);

  // One character less drops the fragment entirely, never truncating it
  auto short_by_one = registry_.generate_catalog(one_fragment - 1);
  EXPECT_EQ(short_by_one, std::string(CATALOG_OPEN_TAG) + CATALOG_CLOSE_TAG);

  // Smaller than the wrapper itself: still well-formed
  auto tiny = registry_.generate_catalog(5);
  EXPECT_EQ(tiny, std::string(CATALOG_OPEN_TAG) + CATALOG_CLOSE_TAG);
}

TEST_F(SkillRegistryTest, CatalogStopsAtFirstFragmentThatDoesNotFit) {
  registry_.register_skill(make_skill("a", "short", SkillLocation::Project));
  registry_.register_skill(make_skill("b", std::string(400, 'x'), SkillLocation::Project));
  registry_.register_skill(make_skill("c", "short", SkillLocation::Project));

  auto catalog = registry_.generate_catalog(300);
  EXPECT_NE(catalog.find("<name>a</name>"), std::string::npos);
  EXPECT_EQ(catalog.find("<name>b</name>"), std::string::npos);
  EXPECT_EQ(catalog.find("<name>c</name>"), std::string::npos);
}
