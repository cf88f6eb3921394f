//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Builds the flat name/value view of a CompilerOptions record.  The listing is
// the single place that enumerates every field, which is what lets tests diff
// a record before and after a preset and lets the CLI print the result.  A
// field added to CompilerOptions must be added here too, or diffs will not
// see it.
//
//===----------------------------------------------------------------------===//

#include "options/OptionTable.hpp"

#include <array>
#include <ostream>

namespace jsopt::options
{
namespace
{

constexpr std::array<DiagnosticGroup, 1> kDiagnosticGroups = {DiagnosticGroup::GlobalThis};

void add(std::vector<OptionEntry> &out, const char *name, bool value)
{
    out.push_back({name, value ? "true" : "false"});
}

template <typename Enum> void add(std::vector<OptionEntry> &out, const char *name, Enum value)
{
    out.push_back({name, toString(value)});
}

} // namespace

std::vector<OptionEntry> listOptions(const CompilerOptions &o)
{
    std::vector<OptionEntry> out;
    out.reserve(64);

    add(out, "skipAllPasses", o.skipAllPasses);
    add(out, "dependencyMode", o.dependencyMode);
    add(out, "closurePass", o.closurePass);
    add(out, "replaceIdGenerators", o.replaceIdGenerators);

    add(out, "checks.checkSymbols", o.checks.checkSymbols);
    add(out, "checks.checkTypes", o.checks.checkTypes);
    for (DiagnosticGroup group : kDiagnosticGroups)
    {
        std::string name = std::string("checks.warnings.") + toString(group);
        auto level = o.warningLevel(group);
        out.push_back({std::move(name), level ? toString(*level) : "default"});
    }

    add(out, "renaming.variables", o.renaming.variables);
    add(out, "renaming.properties", o.renaming.properties);
    add(out, "renaming.labelRenaming", o.renaming.labelRenaming);
    add(out, "renaming.generatePseudoNames", o.renaming.generatePseudoNames);

    add(out, "inlining.variables", o.inlining.variables);
    add(out, "inlining.functions", o.inlining.functions);
    add(out, "inlining.constantVars", o.inlining.constantVars);
    add(out,
        "inlining.assumeClosuresOnlyCaptureReferences",
        o.inlining.assumeClosuresOnlyCaptureReferences);

    add(out, "local.foldConstants", o.local.foldConstants);
    add(out, "local.coalesceVariableNames", o.local.coalesceVariableNames);
    add(out, "local.collapseVariableDeclarations", o.local.collapseVariableDeclarations);
    add(out, "local.convertToDottedProperties", o.local.convertToDottedProperties);
    add(out, "local.optimizeArgumentsArray", o.local.optimizeArgumentsArray);
    add(out, "local.collapseObjectLiterals", o.local.collapseObjectLiterals);
    add(out, "local.protectHiddenSideEffects", o.local.protectHiddenSideEffects);
    add(out,
        "local.extractPrototypeMemberDeclarations",
        o.local.extractPrototypeMemberDeclarations);
    add(out, "local.collapseAnonymousFunctions", o.local.collapseAnonymousFunctions);
    add(out, "local.rewriteFunctionExpressions", o.local.rewriteFunctionExpressions);
    add(out, "local.computeFunctionSideEffects", o.local.computeFunctionSideEffects);
    add(out, "local.assumeStrictThis", o.local.assumeStrictThis);

    add(out, "collapseProperties", o.collapseProperties);

    add(out, "deadCode.removeUnreachableCode", o.deadCode.removeUnreachableCode);
    add(out, "deadCode.deadAssignmentElimination", o.deadCode.deadAssignmentElimination);
    add(out, "deadCode.removeUnusedVariables", o.deadCode.removeUnusedVariables);
    add(out,
        "deadCode.removeUnusedPrototypeProperties",
        o.deadCode.removeUnusedPrototypeProperties);
    add(out, "deadCode.removeUnusedClassProperties", o.deadCode.removeUnusedClassProperties);
    add(out, "deadCode.smartNameRemoval", o.deadCode.smartNameRemoval);
    add(out, "deadCode.removeAbstractMethods", o.deadCode.removeAbstractMethods);
    add(out, "deadCode.removeClosureAsserts", o.deadCode.removeClosureAsserts);
    add(out, "deadCode.removeJ2clAsserts", o.deadCode.removeJ2clAsserts);

    add(out, "crossChunk.codeMotion", o.crossChunk.codeMotion);
    add(out, "crossChunk.methodMotion", o.crossChunk.methodMotion);

    add(out, "calls.devirtualizeMethods", o.calls.devirtualizeMethods);
    add(out, "calls.optimizeCalls", o.calls.optimizeCalls);
    add(out, "calls.optimizeESClassConstructors", o.calls.optimizeESClassConstructors);

    add(out, "typeBased.disambiguateProperties", o.typeBased.disambiguateProperties);
    add(out, "typeBased.ambiguateProperties", o.typeBased.ambiguateProperties);
    add(out, "typeBased.inlineProperties", o.typeBased.inlineProperties);
    add(out, "typeBased.useTypesForLocalOptimization", o.typeBased.useTypesForLocalOptimization);

    add(out, "exports.reserveRawExports", o.exports.reserveRawExports);
    return out;
}

std::vector<std::string> diffOptions(const CompilerOptions &before, const CompilerOptions &after)
{
    const auto lhs = listOptions(before);
    const auto rhs = listOptions(after);
    std::vector<std::string> changed;
    for (size_t i = 0; i < lhs.size(); ++i)
    {
        if (lhs[i].value != rhs[i].value)
            changed.push_back(lhs[i].name);
    }
    return changed;
}

bool optionsEqual(const CompilerOptions &lhs, const CompilerOptions &rhs)
{
    return diffOptions(lhs, rhs).empty();
}

void printOptions(std::ostream &os, const CompilerOptions &options)
{
    for (const auto &entry : listOptions(options))
        os << entry.name << " = " << entry.value << '\n';
}

void printOptionDiff(std::ostream &os, const CompilerOptions &before, const CompilerOptions &after)
{
    const auto lhs = listOptions(before);
    const auto rhs = listOptions(after);
    for (size_t i = 0; i < rhs.size(); ++i)
    {
        if (lhs[i].value != rhs[i].value)
            os << rhs[i].name << " = " << rhs[i].value << '\n';
    }
}

} // namespace jsopt::options
