//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: options/CompilerOptions.cpp
// Purpose: Implements the named setters of CompilerOptions and the spellings
//          of its enumerations.
// Key invariants: Each setter writes only the fields it names.
// Ownership/Lifetime: Operates on caller-owned records.
//
//===----------------------------------------------------------------------===//

#include "options/CompilerOptions.hpp"

namespace jsopt::options
{

void CompilerOptions::skipAllCompilerPasses()
{
    skipAllPasses = true;
}

void CompilerOptions::setRenamingPolicy(VariableRenamingPolicy variables,
                                        PropertyRenamingPolicy properties)
{
    renaming.variables = variables;
    renaming.properties = properties;
}

void CompilerOptions::setWarningLevel(DiagnosticGroup group, CheckLevel level)
{
    checks.warningLevels[group] = level;
}

std::optional<CheckLevel> CompilerOptions::warningLevel(DiagnosticGroup group) const
{
    auto it = checks.warningLevels.find(group);
    if (it == checks.warningLevels.end())
        return std::nullopt;
    return it->second;
}

// The spellings below appear in option dumps and CLI output; keep them stable.

const char *toString(Reach reach)
{
    switch (reach)
    {
        case Reach::None:
            return "none";
        case Reach::LocalOnly:
            return "local-only";
        case Reach::All:
            return "all";
    }
    return "";
}

const char *toString(VariableRenamingPolicy policy)
{
    switch (policy)
    {
        case VariableRenamingPolicy::Off:
            return "off";
        case VariableRenamingPolicy::Local:
            return "local";
        case VariableRenamingPolicy::All:
            return "all";
    }
    return "";
}

const char *toString(PropertyRenamingPolicy policy)
{
    switch (policy)
    {
        case PropertyRenamingPolicy::Off:
            return "off";
        case PropertyRenamingPolicy::AllUnquoted:
            return "all-unquoted";
    }
    return "";
}

const char *toString(PropertyCollapseLevel level)
{
    switch (level)
    {
        case PropertyCollapseLevel::None:
            return "none";
        case PropertyCollapseLevel::ModuleExport:
            return "module-export";
        case PropertyCollapseLevel::All:
            return "all";
    }
    return "";
}

const char *toString(DependencyMode mode)
{
    switch (mode)
    {
        case DependencyMode::None:
            return "none";
        case DependencyMode::SortOnly:
            return "sort-only";
        case DependencyMode::Prune:
            return "prune";
    }
    return "";
}

const char *toString(CheckLevel level)
{
    switch (level)
    {
        case CheckLevel::Off:
            return "off";
        case CheckLevel::Warning:
            return "warning";
        case CheckLevel::Error:
            return "error";
    }
    return "";
}

const char *toString(DiagnosticGroup group)
{
    switch (group)
    {
        case DiagnosticGroup::GlobalThis:
            return "globalThis";
    }
    return "";
}

} // namespace jsopt::options
