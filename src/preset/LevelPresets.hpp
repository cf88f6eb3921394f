//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: preset/LevelPresets.hpp
// Purpose: Declare the primary preset for each compilation level.
// Key invariants: Exactly one primary preset configures a record; presets are
//                 not cumulative and never read the record they write.
// Ownership/Lifetime: Presets borrow the caller's record for the call only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "options/CompilerOptions.hpp"
#include "preset/CompilationLevel.hpp"

namespace jsopt::preset
{

/// @brief Write the toggles that define @p level into @p options.
/// @details Bundle leaves the record untouched; WhitespaceOnly only skips all
///          passes; Simple and Advanced each write their own complete list.
///          Fields a level does not mention keep the caller's values.
/// @param level Level to apply.
/// @param options Caller-owned record; must not be written concurrently.
void applyCompilationLevel(CompilationLevel level, options::CompilerOptions &options);

} // namespace jsopt::preset
