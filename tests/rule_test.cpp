#include <pyscan/rule.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>

namespace pyscan {
namespace {

using ::testing::HasSubstr;

TEST(RuleTest, ExpandsIndexedPlaceholdersWithCaseModifiers) {
  const std::vector<std::string> captures = {"api_key = 'x'", "api_key"};

  EXPECT_EQ(ExpandTemplate("{1} = os.getenv(\"{1:upper}\")", captures),
            "api_key = os.getenv(\"API_KEY\")");
  EXPECT_EQ(ExpandTemplate("{1:lower} and {0}", {"MD5", "MD5"}), "md5 and MD5");
}

TEST(RuleTest, LeavesNonPlaceholderBracesAndMissingCapturesAlone) {
  EXPECT_EQ(ExpandTemplate("f\"{var1}{var2}\"", {}), "f\"{var1}{var2}\"");
  EXPECT_EQ(ExpandTemplate("value {3} end", {"a"}), "value  end");
  EXPECT_EQ(ExpandTemplate("dangling {1", {"a", "b"}), "dangling {1");
}

TEST(RuleTest, ParsesCategoryAndSeverityNames) {
  EXPECT_EQ(ParseCategory("Security"), Category::kSecurity);
  EXPECT_EQ(ParseCategory("dead-code"), Category::kDeadCode);
  EXPECT_EQ(ParseCategory("code_smells"), Category::kQuality);
  EXPECT_EQ(ParseSeverity("WARNING"), Severity::kWarning);
  EXPECT_EQ(ParseSeverity("warn"), Severity::kWarning);

  EXPECT_THROW(ParseCategory("style_guide"), std::invalid_argument);
  EXPECT_THROW(ParseSeverity("fatal"), std::invalid_argument);
}

TEST(RuleTest, CategoryNamesRoundTripForEveryCategory) {
  for (const auto category : AllCategoriesInOrder()) {
    EXPECT_EQ(ParseCategory(CategoryName(category)), category);
  }
  EXPECT_EQ(AllCategoriesInOrder().size(), 7u);
}

TEST(RuleTest, RejectsInvalidPatternsWhenCompiled) {
  try {
    MakePattern("execute(");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("execute("));
  }
  EXPECT_THROW(MakePredicate(nullptr), std::invalid_argument);
}

TEST(RuleTest, DefaultCatalogHasUniqueIdsAndCoversEveryCategory) {
  const auto rules = MakeDefaultRules();
  std::set<std::string> ids;
  std::set<Category> categories;
  for (const auto &rule : rules) {
    EXPECT_TRUE(ids.insert(rule.id).second) << "duplicate id " << rule.id;
    EXPECT_FALSE(rule.description_template.empty()) << rule.id;
    EXPECT_EQ(rule.id.rfind(CategoryName(rule.category) + ".", 0), 0u)
        << rule.id;
    categories.insert(rule.category);
  }
  EXPECT_EQ(categories.size(), AllCategoriesInOrder().size());
}

} // namespace
} // namespace pyscan
