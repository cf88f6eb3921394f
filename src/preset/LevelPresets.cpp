//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the primary presets.  Each level owns a flat list of field
// writes.  The advanced list repeats the safe optimizations instead of calling
// the simple preset: the two lists are kept in agreement by the
// LevelPresets.SharedTogglesAgree test, not by shared code, so an edit to the
// simple preset cannot silently change advanced mode.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Primary presets for the four compilation levels.

#include "preset/LevelPresets.hpp"

namespace jsopt::preset
{
namespace
{

using options::CheckLevel;
using options::CompilerOptions;
using options::DependencyMode;
using options::DiagnosticGroup;
using options::PropertyCollapseLevel;
using options::PropertyRenamingPolicy;
using options::Reach;
using options::VariableRenamingPolicy;

/// @brief Strip whitespace and comments only.
void applyBasicOptions(CompilerOptions &o)
{
    o.skipAllCompilerPasses();
}

/// @brief Optimizations that are correct even when no symbol is exported and
///        no coding convention is followed.
/// @details Does not call applyBasicOptions: skipping all passes cannot be
///          undone by later writes.
void applySafeOptions(CompilerOptions &o)
{
    o.dependencyMode = DependencyMode::SortOnly;

    // On by default, but requires whole-program knowledge.
    o.replaceIdGenerators = false;

    o.closurePass = true;
    o.setRenamingPolicy(VariableRenamingPolicy::Local, PropertyRenamingPolicy::Off);
    o.inlining.variables = Reach::LocalOnly;
    o.inlining.functions = Reach::LocalOnly;
    o.inlining.assumeClosuresOnlyCaptureReferences = false;
    o.setWarningLevel(DiagnosticGroup::GlobalThis, CheckLevel::Off);
    o.local.foldConstants = true;
    o.local.coalesceVariableNames = true;
    o.deadCode.deadAssignmentElimination = true;
    o.local.collapseVariableDeclarations = true;
    o.local.convertToDottedProperties = true;
    o.renaming.labelRenaming = true;
    o.deadCode.removeUnreachableCode = true;
    o.local.optimizeArgumentsArray = true;
    o.deadCode.removeUnusedVariables = Reach::LocalOnly;
    o.local.collapseObjectLiterals = true;
    o.local.protectHiddenSideEffects = true;
}

/// @brief Optimizations that are correct only if every externally used symbol
///        is exported.
void applyFullOptions(CompilerOptions &o)
{
    o.dependencyMode = DependencyMode::SortOnly;

    o.checks.checkSymbols = true;
    o.checks.checkTypes = true;

    // Safe optimizations.
    o.closurePass = true;
    o.local.foldConstants = true;
    o.local.coalesceVariableNames = true;
    o.deadCode.deadAssignmentElimination = true;
    o.local.extractPrototypeMemberDeclarations = true;
    o.local.collapseVariableDeclarations = true;
    o.local.convertToDottedProperties = true;
    o.renaming.labelRenaming = true;
    o.deadCode.removeUnreachableCode = true;
    o.local.optimizeArgumentsArray = true;
    o.local.collapseObjectLiterals = true;
    o.local.protectHiddenSideEffects = true;

    // Advanced optimizations.
    o.deadCode.removeClosureAsserts = true;
    o.deadCode.removeAbstractMethods = true;
    o.exports.reserveRawExports = true;

    // Property renaming stays off: renaming unquoted properties also renames
    // host APIs that have no externs.
    o.setRenamingPolicy(VariableRenamingPolicy::All, PropertyRenamingPolicy::Off);

    // Also inlines getters of removed prototype properties.
    o.deadCode.removeUnusedPrototypeProperties = true;
    o.deadCode.removeUnusedClassProperties = true;
    o.local.collapseAnonymousFunctions = true;
    o.collapseProperties = PropertyCollapseLevel::All;
    o.setWarningLevel(DiagnosticGroup::GlobalThis, CheckLevel::Warning);
    o.local.rewriteFunctionExpressions = false;
    o.deadCode.smartNameRemoval = true;
    o.inlining.constantVars = true;
    o.inlining.functions = Reach::All;
    o.inlining.assumeClosuresOnlyCaptureReferences = false;
    o.inlining.variables = Reach::All;
    o.local.computeFunctionSideEffects = true;
    o.local.assumeStrictThis = true;

    // Also removes unused functions.
    o.deadCode.removeUnusedVariables = Reach::All;

    o.crossChunk.codeMotion = true;
    o.crossChunk.methodMotion = true;

    o.calls.devirtualizeMethods = true;
    o.calls.optimizeCalls = true;
    o.calls.optimizeESClassConstructors = true;
}

} // namespace

void applyCompilationLevel(CompilationLevel level, options::CompilerOptions &options)
{
    switch (level)
    {
        case CompilationLevel::Bundle:
            break;
        case CompilationLevel::WhitespaceOnly:
            applyBasicOptions(options);
            break;
        case CompilationLevel::Simple:
            applySafeOptions(options);
            break;
        case CompilationLevel::Advanced:
            applyFullOptions(options);
            break;
    }
}

} // namespace jsopt::preset
