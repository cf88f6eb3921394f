//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file CompilerOptions.hpp
/// @brief Options record consumed by the JavaScript transformation pipeline.
///
/// @details Defines the CompilerOptions struct and the small enums its fields
/// use. Each field enables or scopes one pipeline capability; fields are
/// grouped by concern (renaming, inlining reach, dead code, ...) so the
/// toggle lists written by the compilation-level presets can be read side by
/// side. The presets in preset/ only write into this record; construction,
/// defaults and consumption belong to the caller and the pipeline.
///
/// @invariant Every field is independent: setting one never changes another.
/// @invariant A default-constructed record runs no optional optimization.
///
/// Ownership/Lifetime: Value type owned by the caller. Not synchronised;
/// concurrent writers need external locking.
///
/// @see LevelPresets.hpp: primary presets that populate the record.
/// @see OptionTable.hpp: flat name/value listing used for diffs and dumps.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <optional>

namespace jsopt::options
{

/// @brief Breadth over which a definition may be substituted or removed.
enum class Reach
{
    None,      ///< Never.
    LocalOnly, ///< Function-local names only.
    All        ///< Local and global names.
};

/// @brief Scope in which variables may be renamed.
enum class VariableRenamingPolicy
{
    Off,   ///< Keep every variable name.
    Local, ///< Rename function-local variables only.
    All    ///< Rename local and global variables.
};

/// @brief Policy for renaming object properties.
enum class PropertyRenamingPolicy
{
    Off,        ///< Keep every property name.
    AllUnquoted ///< Rename unquoted properties not declared in externs.
};

/// @brief Degree to which qualified names (a.b.c) are flattened into a$b$c.
enum class PropertyCollapseLevel
{
    None,         ///< No collapsing.
    ModuleExport, ///< Only properties on module export objects.
    All           ///< Every qualified name that is safe to collapse.
};

/// @brief How input files are ordered and pruned by their dependency graph.
enum class DependencyMode
{
    None,     ///< Keep inputs in command-line order.
    SortOnly, ///< Topologically sort inputs, keep all of them.
    Prune     ///< Sort and drop inputs unreachable from entry points.
};

/// @brief Severity a diagnostic group is reported at.
enum class CheckLevel
{
    Off,
    Warning,
    Error
};

/// @brief Diagnostic groups whose severity a preset may override.
enum class DiagnosticGroup
{
    GlobalThis ///< Dangerous use of the global `this` object.
};

/// @brief Mutable configuration for one compilation run.
struct CompilerOptions
{
    /// @brief Run no transformation pass; only whitespace and comments are stripped.
    bool skipAllPasses{false};

    /// @brief Input ordering applied before compilation.
    DependencyMode dependencyMode{DependencyMode::None};

    /// @brief Recognise Closure Library conventions (goog.provide/require).
    bool closurePass{false};

    /// @brief Replace calls to id-generator functions with short constants.
    /// @details Only safe with whole-program knowledge, so simple mode turns it off.
    bool replaceIdGenerators{true};

    /// @brief Semantic checks.
    struct Checks
    {
        bool checkSymbols{false};
        bool checkTypes{false};

        /// @brief Per-group severity overrides; absent groups keep their built-in level.
        std::map<DiagnosticGroup, CheckLevel> warningLevels;
    } checks;

    /// @brief Identifier renaming.
    struct Renaming
    {
        VariableRenamingPolicy variables{VariableRenamingPolicy::Off};
        PropertyRenamingPolicy properties{PropertyRenamingPolicy::Off};
        bool labelRenaming{false};

        /// @brief Emit readable pseudo-names instead of minified identifiers.
        bool generatePseudoNames{false};
    } renaming;

    /// @brief Inlining reach.
    struct Inlining
    {
        Reach variables{Reach::None};
        Reach functions{Reach::None};
        bool constantVars{false};
        bool assumeClosuresOnlyCaptureReferences{false};
    } inlining;

    /// @brief Local, syntax-level optimizations.
    struct LocalOptimizations
    {
        bool foldConstants{false};
        bool coalesceVariableNames{false};
        bool collapseVariableDeclarations{false};
        bool convertToDottedProperties{false};
        bool optimizeArgumentsArray{false};
        bool collapseObjectLiterals{false};
        bool protectHiddenSideEffects{false};
        bool extractPrototypeMemberDeclarations{false};
        bool collapseAnonymousFunctions{false};
        bool rewriteFunctionExpressions{false};
        bool computeFunctionSideEffects{false};
        bool assumeStrictThis{false};
    } local;

    /// @brief Qualified-name collapsing degree.
    PropertyCollapseLevel collapseProperties{PropertyCollapseLevel::None};

    /// @brief Dead-code elimination.
    struct DeadCode
    {
        bool removeUnreachableCode{false};
        bool deadAssignmentElimination{false};
        Reach removeUnusedVariables{Reach::None};
        bool removeUnusedPrototypeProperties{false};
        bool removeUnusedClassProperties{false};
        bool smartNameRemoval{false};
        bool removeAbstractMethods{false};
        bool removeClosureAsserts{false};
        bool removeJ2clAsserts{true};
    } deadCode;

    /// @brief Motion of code between output chunks.
    struct CrossChunk
    {
        bool codeMotion{false};
        bool methodMotion{false};
    } crossChunk;

    /// @brief Call-site optimizations.
    struct Calls
    {
        bool devirtualizeMethods{false};
        /// Removes unused parameters and return values; implies further unused-code removal.
        bool optimizeCalls{false};
        bool optimizeESClassConstructors{false};
    } calls;

    /// @brief Optimizations that rely on type information.
    struct TypeBased
    {
        bool disambiguateProperties{false};
        bool ambiguateProperties{false};
        bool inlineProperties{false};
        bool useTypesForLocalOptimization{false};
    } typeBased;

    /// @brief Handling of names that form the public interface.
    struct Exports
    {
        bool reserveRawExports{false};
    } exports;

    /// @brief Disable every transformation pass.
    void skipAllCompilerPasses();

    /// @brief Set variable and property renaming together.
    void setRenamingPolicy(VariableRenamingPolicy variables, PropertyRenamingPolicy properties);

    /// @brief Override the severity of diagnostic group @p group.
    void setWarningLevel(DiagnosticGroup group, CheckLevel level);

    /// @brief Look up the severity override for @p group.
    /// @return The override, or std::nullopt when the group keeps its built-in level.
    std::optional<CheckLevel> warningLevel(DiagnosticGroup group) const;
};

const char *toString(Reach reach);
const char *toString(VariableRenamingPolicy policy);
const char *toString(PropertyRenamingPolicy policy);
const char *toString(PropertyCollapseLevel level);
const char *toString(DependencyMode mode);
const char *toString(CheckLevel level);
const char *toString(DiagnosticGroup group);

} // namespace jsopt::options
