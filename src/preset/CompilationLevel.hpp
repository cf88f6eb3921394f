//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file CompilationLevel.hpp
/// @brief Named optimization levels and their textual aliases.
///
/// @details The level set is closed. Code that dispatches on a level uses an
/// exhaustive switch without a default label so that adding a level is a
/// compile-time event for every preset.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace jsopt::preset
{

/// @brief Optimization level applied to a compilation.
enum class CompilationLevel
{
    Bundle,         ///< Order and concatenate inputs only.
    WhitespaceOnly, ///< Strip comments and whitespace.
    Simple,         ///< Optimizations that keep every global name intact.
    Advanced        ///< Whole-program optimizations; requires correct exports.
};

/// @brief Every level, in increasing order of aggressiveness.
inline constexpr std::array<CompilationLevel, 4> kAllCompilationLevels = {
    CompilationLevel::Bundle,
    CompilationLevel::WhitespaceOnly,
    CompilationLevel::Simple,
    CompilationLevel::Advanced,
};

/// @brief Resolve a level from its name or alias.
/// @details Matching is exact and case-sensitive: "BUNDLE", "WHITESPACE_ONLY",
///          "WHITESPACE", "SIMPLE_OPTIMIZATIONS", "SIMPLE",
///          "ADVANCED_OPTIMIZATIONS" and "ADVANCED".
/// @return The level, or std::nullopt for any other text including "".
std::optional<CompilationLevel> parseCompilationLevel(std::string_view text);

/// @brief Canonical name of @p level, e.g. "SIMPLE_OPTIMIZATIONS".
const char *toString(CompilationLevel level);

/// @brief Every spelling parseCompilationLevel accepts for @p level, canonical first.
std::vector<std::string_view> levelAliases(CompilationLevel level);

} // namespace jsopt::preset
