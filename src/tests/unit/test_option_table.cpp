// File: tests/unit/test_option_table.cpp
// Purpose: Verify the flat listing, diff and printing of CompilerOptions.
// Key invariants: Names are unique and stable; diffs report exactly the changed fields.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include "options/OptionTable.hpp"

#include <set>
#include <sstream>
#include <string>

using namespace jsopt::options;

TEST(OptionTable, NamesAreUnique)
{
    auto entries = listOptions(CompilerOptions{});
    std::set<std::string> names;
    for (const auto &entry : entries)
        EXPECT_TRUE(names.insert(entry.name).second) << entry.name;
    EXPECT_GT(entries.size(), 40u);
}

TEST(OptionTable, DefaultRecordRendering)
{
    std::ostringstream os;
    printOptions(os, CompilerOptions{});
    const std::string text = os.str();
    EXPECT_NE(text.find("skipAllPasses = false\n"), std::string::npos);
    EXPECT_NE(text.find("dependencyMode = none\n"), std::string::npos);
    EXPECT_NE(text.find("replaceIdGenerators = true\n"), std::string::npos);
    EXPECT_NE(text.find("checks.warnings.globalThis = default\n"), std::string::npos);
    EXPECT_NE(text.find("inlining.functions = none\n"), std::string::npos);
    EXPECT_NE(text.find("deadCode.removeJ2clAsserts = true\n"), std::string::npos);
}

TEST(OptionTable, DiffReportsExactlyChangedFields)
{
    CompilerOptions before;
    CompilerOptions after;
    EXPECT_TRUE(diffOptions(before, after).empty());
    EXPECT_TRUE(optionsEqual(before, after));

    after.inlining.variables = Reach::LocalOnly;
    after.setWarningLevel(DiagnosticGroup::GlobalThis, CheckLevel::Error);
    auto changed = diffOptions(before, after);
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "checks.warnings.globalThis");
    EXPECT_EQ(changed[1], "inlining.variables");
    EXPECT_FALSE(optionsEqual(before, after));
}

TEST(OptionTable, PrintDiffShowsNewValues)
{
    CompilerOptions after;
    after.collapseProperties = PropertyCollapseLevel::ModuleExport;
    after.setRenamingPolicy(VariableRenamingPolicy::Local, PropertyRenamingPolicy::AllUnquoted);

    std::ostringstream os;
    printOptionDiff(os, CompilerOptions{}, after);
    EXPECT_EQ(os.str(),
              "renaming.variables = local\n"
              "renaming.properties = all-unquoted\n"
              "collapseProperties = module-export\n");
}

TEST(CompilerOptions, SettersWriteOnlyTheirFields)
{
    CompilerOptions options;
    options.skipAllCompilerPasses();
    auto changed = diffOptions(CompilerOptions{}, options);
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0], "skipAllPasses");

    EXPECT_FALSE(options.warningLevel(DiagnosticGroup::GlobalThis).has_value());
    options.setWarningLevel(DiagnosticGroup::GlobalThis, CheckLevel::Off);
    auto level = options.warningLevel(DiagnosticGroup::GlobalThis);
    ASSERT_TRUE(level.has_value());
    EXPECT_EQ(*level, CheckLevel::Off);
}
