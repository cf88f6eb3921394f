//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: preset/PresetPipeline.hpp
// Purpose: Sequence a primary preset and its add-ons on one options record.
// Key invariants: The primary preset always runs first so add-ons that touch
//                 the same fields win.
// Ownership/Lifetime: Borrows the caller's record and optional trace stream.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "options/CompilerOptions.hpp"
#include "preset/CompilationLevel.hpp"
#include "support/diag_expected.hpp"

#include <iosfwd>
#include <string_view>

namespace jsopt::preset
{

/// @brief Which level and add-ons a caller wants.
struct PresetRequest
{
    /// @brief Primary level.
    CompilationLevel level{CompilationLevel::Simple};

    /// @brief Apply applyDebugOptions.
    bool debug{false};

    /// @brief Apply applyTypeBasedOptimizations.
    bool useTypesForOptimization{false};

    /// @brief Apply applyWrappedOutputOptimizations.
    bool assumeFunctionWrapper{false};
};

/// @brief Add-on selection used when the level arrives as text.
struct AddOnFlags
{
    bool debug{false};
    bool useTypesForOptimization{false};
    bool assumeFunctionWrapper{false};
};

/// @brief Configure @p options for @p request.
/// @details Runs the primary preset, then the debug, type-based and
///          wrapped-output add-ons that were requested, in that order.
/// @param trace When non-null, receives one "[preset] ..." line per step.
void configureOptions(const PresetRequest &request,
                      options::CompilerOptions &options,
                      std::ostream *trace = nullptr);

/// @brief Parse @p levelText and configure a default-constructed record.
/// @return The configured record, or an error diagnostic naming the unknown level.
support::Expected<options::CompilerOptions> resolvePreset(std::string_view levelText,
                                                          const AddOnFlags &flags,
                                                          std::ostream *trace = nullptr);

} // namespace jsopt::preset
