//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: preset/AddOnPresets.cpp
// Purpose: Implements the type-based, wrapped-output and debug add-ons.
// Key invariants: Level switches are exhaustive and carry no default label.
// Ownership/Lifetime: Operates on caller-owned records.
//
//===----------------------------------------------------------------------===//

#include "preset/AddOnPresets.hpp"

namespace jsopt::preset
{

using options::PropertyCollapseLevel;
using options::Reach;
using options::VariableRenamingPolicy;

void applyTypeBasedOptimizations(CompilationLevel level, options::CompilerOptions &options)
{
    switch (level)
    {
        case CompilationLevel::Advanced:
            options.typeBased.disambiguateProperties = true;
            options.typeBased.ambiguateProperties = true;
            options.typeBased.inlineProperties = true;
            options.typeBased.useTypesForLocalOptimization = true;
            break;
        case CompilationLevel::Simple:
        case CompilationLevel::WhitespaceOnly:
        case CompilationLevel::Bundle:
            break;
    }
}

void applyWrappedOutputOptimizations(CompilationLevel level, options::CompilerOptions &options)
{
    // Wrapped globals cannot conflict with names in other scripts.
    options.exports.reserveRawExports = false;

    switch (level)
    {
        case CompilationLevel::Simple:
            // Global variable optimizations only; properties stay untouched.
            options.renaming.variables = VariableRenamingPolicy::All;
            options.collapseProperties = PropertyCollapseLevel::ModuleExport;
            options.local.collapseAnonymousFunctions = true;
            options.inlining.constantVars = true;
            options.inlining.functions = Reach::All;
            options.inlining.variables = Reach::All;
            options.deadCode.removeUnusedVariables = Reach::All;
            break;
        case CompilationLevel::Advanced:
        case CompilationLevel::WhitespaceOnly:
        case CompilationLevel::Bundle:
            break;
    }
}

void applyDebugOptions(options::CompilerOptions &options)
{
    options.renaming.generatePseudoNames = true;
    options.deadCode.removeClosureAsserts = false;
    options.deadCode.removeJ2clAsserts = false;
}

} // namespace jsopt::preset
