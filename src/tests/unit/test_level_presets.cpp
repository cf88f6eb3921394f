// File: tests/unit/test_level_presets.cpp
// Purpose: Check the toggles written by each primary compilation-level preset.
// Key invariants: Presets touch only their documented fields; the simple and
//                 advanced lists agree on every toggle they both set.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include "options/OptionTable.hpp"
#include "preset/LevelPresets.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace jsopt::options;
using jsopt::preset::applyCompilationLevel;
using jsopt::preset::CompilationLevel;
using jsopt::preset::kAllCompilationLevels;

namespace
{

CompilerOptions configured(CompilationLevel level)
{
    CompilerOptions options;
    applyCompilationLevel(level, options);
    return options;
}

std::map<std::string, std::string> asMap(const CompilerOptions &options)
{
    std::map<std::string, std::string> values;
    for (auto &entry : listOptions(options))
        values[entry.name] = entry.value;
    return values;
}

} // namespace

TEST(LevelPresets, BundleLeavesDefaultsUntouched)
{
    EXPECT_TRUE(optionsEqual(configured(CompilationLevel::Bundle), CompilerOptions{}));
}

TEST(LevelPresets, BundleKeepsCallerValues)
{
    CompilerOptions options;
    options.local.foldConstants = true;
    options.inlining.functions = Reach::All;
    CompilerOptions before = options;

    applyCompilationLevel(CompilationLevel::Bundle, options);
    EXPECT_TRUE(optionsEqual(before, options));
}

TEST(LevelPresets, WhitespaceOnlySetsOnlySkipAllPasses)
{
    auto changed = diffOptions(CompilerOptions{}, configured(CompilationLevel::WhitespaceOnly));
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0], "skipAllPasses");
}

TEST(LevelPresets, SimpleRenamesLocallyAndInlinesLocally)
{
    auto o = configured(CompilationLevel::Simple);
    EXPECT_EQ(o.renaming.variables, VariableRenamingPolicy::Local);
    EXPECT_EQ(o.renaming.properties, PropertyRenamingPolicy::Off);
    EXPECT_EQ(o.inlining.variables, Reach::LocalOnly);
    EXPECT_EQ(o.inlining.functions, Reach::LocalOnly);
    EXPECT_EQ(o.deadCode.removeUnusedVariables, Reach::LocalOnly);
    EXPECT_EQ(o.dependencyMode, DependencyMode::SortOnly);
    EXPECT_FALSE(o.replaceIdGenerators);
    EXPECT_TRUE(o.closurePass);
    auto globalThis = o.warningLevel(DiagnosticGroup::GlobalThis);
    ASSERT_TRUE(globalThis.has_value());
    EXPECT_EQ(*globalThis, CheckLevel::Off);
    EXPECT_FALSE(o.skipAllPasses);
}

TEST(LevelPresets, SimpleLeavesWholeProgramOptimizationsOff)
{
    auto o = configured(CompilationLevel::Simple);
    EXPECT_FALSE(o.checks.checkSymbols);
    EXPECT_FALSE(o.checks.checkTypes);
    EXPECT_FALSE(o.inlining.constantVars);
    EXPECT_EQ(o.collapseProperties, PropertyCollapseLevel::None);
    EXPECT_FALSE(o.local.collapseAnonymousFunctions);
    EXPECT_FALSE(o.exports.reserveRawExports);
    EXPECT_FALSE(o.crossChunk.codeMotion);
    EXPECT_FALSE(o.calls.optimizeCalls);
}

TEST(LevelPresets, AdvancedChecksAndRenamesGlobally)
{
    auto o = configured(CompilationLevel::Advanced);
    EXPECT_TRUE(o.checks.checkSymbols);
    EXPECT_TRUE(o.checks.checkTypes);
    EXPECT_EQ(o.renaming.variables, VariableRenamingPolicy::All);
    EXPECT_EQ(o.renaming.properties, PropertyRenamingPolicy::Off);
    auto globalThis = o.warningLevel(DiagnosticGroup::GlobalThis);
    ASSERT_TRUE(globalThis.has_value());
    EXPECT_EQ(*globalThis, CheckLevel::Warning);
}

TEST(LevelPresets, AdvancedEnablesWholeProgramOptimizations)
{
    auto o = configured(CompilationLevel::Advanced);
    EXPECT_EQ(o.dependencyMode, DependencyMode::SortOnly);
    EXPECT_TRUE(o.local.extractPrototypeMemberDeclarations);
    EXPECT_TRUE(o.deadCode.removeClosureAsserts);
    EXPECT_TRUE(o.deadCode.removeAbstractMethods);
    EXPECT_TRUE(o.exports.reserveRawExports);
    EXPECT_TRUE(o.deadCode.removeUnusedPrototypeProperties);
    EXPECT_TRUE(o.deadCode.removeUnusedClassProperties);
    EXPECT_TRUE(o.deadCode.smartNameRemoval);
    EXPECT_TRUE(o.local.collapseAnonymousFunctions);
    EXPECT_EQ(o.collapseProperties, PropertyCollapseLevel::All);
    EXPECT_TRUE(o.inlining.constantVars);
    EXPECT_EQ(o.inlining.functions, Reach::All);
    EXPECT_EQ(o.inlining.variables, Reach::All);
    EXPECT_FALSE(o.inlining.assumeClosuresOnlyCaptureReferences);
    EXPECT_TRUE(o.local.computeFunctionSideEffects);
    EXPECT_TRUE(o.local.assumeStrictThis);
    EXPECT_EQ(o.deadCode.removeUnusedVariables, Reach::All);
    EXPECT_TRUE(o.crossChunk.codeMotion);
    EXPECT_TRUE(o.crossChunk.methodMotion);
    EXPECT_TRUE(o.calls.devirtualizeMethods);
    EXPECT_TRUE(o.calls.optimizeCalls);
    EXPECT_TRUE(o.calls.optimizeESClassConstructors);
    EXPECT_FALSE(o.local.rewriteFunctionExpressions);
}

TEST(LevelPresets, AdvancedLeavesAddOnFieldsAlone)
{
    auto o = configured(CompilationLevel::Advanced);
    EXPECT_FALSE(o.typeBased.disambiguateProperties);
    EXPECT_FALSE(o.typeBased.ambiguateProperties);
    EXPECT_FALSE(o.typeBased.inlineProperties);
    EXPECT_FALSE(o.typeBased.useTypesForLocalOptimization);
    EXPECT_FALSE(o.renaming.generatePseudoNames);
    EXPECT_TRUE(o.deadCode.removeJ2clAsserts);
    EXPECT_TRUE(o.replaceIdGenerators);
    EXPECT_FALSE(o.skipAllPasses);
}

// The advanced preset repeats the safe optimizations rather than calling the
// simple preset. This fails when the two lists drift apart.
TEST(LevelPresets, SharedTogglesAgree)
{
    const std::vector<std::string> shared = {
        "dependencyMode",
        "closurePass",
        "local.foldConstants",
        "local.coalesceVariableNames",
        "deadCode.deadAssignmentElimination",
        "local.collapseVariableDeclarations",
        "local.convertToDottedProperties",
        "renaming.labelRenaming",
        "deadCode.removeUnreachableCode",
        "local.optimizeArgumentsArray",
        "local.collapseObjectLiterals",
        "local.protectHiddenSideEffects",
        "inlining.assumeClosuresOnlyCaptureReferences",
        "renaming.properties",
    };

    auto simple = asMap(configured(CompilationLevel::Simple));
    auto advanced = asMap(configured(CompilationLevel::Advanced));
    for (const auto &name : shared)
    {
        ASSERT_EQ(simple.count(name), 1u) << name;
        EXPECT_EQ(simple[name], advanced[name]) << name;
    }

    const auto defaults = asMap(CompilerOptions{});
    for (const auto &name : shared)
    {
        if (name == "inlining.assumeClosuresOnlyCaptureReferences" || name == "renaming.properties")
            continue;
        EXPECT_NE(simple[name], defaults.at(name)) << name << " is not set by the simple preset";
    }
}

TEST(LevelPresets, SimpleChangesExactlyItsList)
{
    auto changed = diffOptions(CompilerOptions{}, configured(CompilationLevel::Simple));
    std::vector<std::string> expected = {
        "dependencyMode",
        "closurePass",
        "replaceIdGenerators",
        "checks.warnings.globalThis",
        "renaming.variables",
        "renaming.labelRenaming",
        "inlining.variables",
        "inlining.functions",
        "local.foldConstants",
        "local.coalesceVariableNames",
        "local.collapseVariableDeclarations",
        "local.convertToDottedProperties",
        "local.optimizeArgumentsArray",
        "local.collapseObjectLiterals",
        "local.protectHiddenSideEffects",
        "deadCode.removeUnreachableCode",
        "deadCode.deadAssignmentElimination",
        "deadCode.removeUnusedVariables",
    };
    std::sort(changed.begin(), changed.end());
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(changed, expected);
}

TEST(LevelPresets, ApplyingTwiceMatchesApplyingOnce)
{
    for (auto level : kAllCompilationLevels)
    {
        CompilerOptions once;
        applyCompilationLevel(level, once);
        CompilerOptions twice;
        applyCompilationLevel(level, twice);
        applyCompilationLevel(level, twice);
        EXPECT_TRUE(optionsEqual(once, twice)) << jsopt::preset::toString(level);
    }
}
