//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: preset/AddOnPresets.hpp
// Purpose: Declare the optional patches layered on top of a primary preset.
// Key invariants: An add-on writes only its own fields, and writes nothing at
//                 all on levels it does not apply to.
// Ownership/Lifetime: Add-ons borrow the caller's record for the call only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "options/CompilerOptions.hpp"
#include "preset/CompilationLevel.hpp"

namespace jsopt::preset
{

/// @brief Enable optimizations that use type information.
/// @details Only Advanced is affected: property disambiguation, property
///          ambiguation, property inlining and type-driven local
///          optimization are enabled. Other levels leave @p options unchanged.
void applyTypeBasedOptimizations(CompilationLevel level, options::CompilerOptions &options);

/// @brief Enable optimizations that are valid once the output is wrapped in a
///        function, so global names can no longer collide with other scripts.
/// @details Raw-export reservation is cleared for every level. Simple also
///          gains global variable renaming, module-export property collapsing,
///          anonymous-function collapsing, constant inlining and all-reach
///          function/variable inlining and unused-variable removal. Advanced
///          already does all of this.
/// @note Run after applyCompilationLevel; later writes win.
void applyWrappedOutputOptimizations(CompilationLevel level, options::CompilerOptions &options);

/// @brief Make the output readable for debugging, whatever the level.
/// @details Pseudo-names replace minified identifiers and assertion removal is
///          turned off so assertions stay in the output.
void applyDebugOptions(options::CompilerOptions &options);

} // namespace jsopt::preset
