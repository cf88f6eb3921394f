//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: preset/CompilationLevel.cpp
// Purpose: Alias table for compilation levels.
// Key invariants: Every alias maps to exactly one level; lookup is case-sensitive.
// Ownership/Lifetime: Alias strings have static storage duration.
//
//===----------------------------------------------------------------------===//

#include "preset/CompilationLevel.hpp"

namespace jsopt::preset
{
namespace
{

struct LevelAlias
{
    std::string_view text;
    CompilationLevel level;
};

// Canonical spelling precedes the short form for each level.
constexpr std::array<LevelAlias, 7> kLevelAliases = {{
    {"BUNDLE", CompilationLevel::Bundle},
    {"WHITESPACE_ONLY", CompilationLevel::WhitespaceOnly},
    {"WHITESPACE", CompilationLevel::WhitespaceOnly},
    {"SIMPLE_OPTIMIZATIONS", CompilationLevel::Simple},
    {"SIMPLE", CompilationLevel::Simple},
    {"ADVANCED_OPTIMIZATIONS", CompilationLevel::Advanced},
    {"ADVANCED", CompilationLevel::Advanced},
}};

} // namespace

std::optional<CompilationLevel> parseCompilationLevel(std::string_view text)
{
    for (const auto &alias : kLevelAliases)
    {
        if (alias.text == text)
            return alias.level;
    }
    return std::nullopt;
}

const char *toString(CompilationLevel level)
{
    switch (level)
    {
        case CompilationLevel::Bundle:
            return "BUNDLE";
        case CompilationLevel::WhitespaceOnly:
            return "WHITESPACE_ONLY";
        case CompilationLevel::Simple:
            return "SIMPLE_OPTIMIZATIONS";
        case CompilationLevel::Advanced:
            return "ADVANCED_OPTIMIZATIONS";
    }
    return "";
}

std::vector<std::string_view> levelAliases(CompilationLevel level)
{
    std::vector<std::string_view> aliases;
    for (const auto &alias : kLevelAliases)
    {
        if (alias.level == level)
            aliases.push_back(alias.text);
    }
    return aliases;
}

} // namespace jsopt::preset
