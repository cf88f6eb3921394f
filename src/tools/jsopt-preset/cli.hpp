// File: src/tools/jsopt-preset/cli.hpp
// Purpose: Command-line parsing and entry point for the jsopt-preset tool.
// Key invariants: Parsing never throws; malformed input becomes a diagnostic.
// Ownership/Lifetime: Parsed options own their strings.

#pragma once

#include "preset/PresetPipeline.hpp"
#include "support/diagnostics.hpp"
#include "tools/common/ArgvView.hpp"

#include <iosfwd>
#include <string>

namespace jsopt::tools::preset
{

/// @brief Settings gathered from the jsopt-preset command line.
struct PresetCliOptions
{
    /// @brief Level text as written by the user; resolved after parsing.
    std::string level = "SIMPLE_OPTIMIZATIONS";

    /// @brief Add-ons requested with their dedicated flags.
    jsopt::preset::AddOnFlags addOns{};

    /// @brief Print only fields that differ from a default record.
    bool changedOnly = false;

    /// @brief Trace preset steps to the error stream.
    bool trace = false;

    /// @brief Print the level table and exit.
    bool listLevels = false;

    bool help = false;
    bool version = false;
};

/// @brief Result of attempting to parse a single option.
enum class OptionParseResult
{
    NotMatched, ///< Argument does not correspond to a known option.
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like a known option but was malformed.
};

/// @brief Parse the option at @p index, advancing it past consumed values.
/// @param index Position in @p args; advanced when a value argument is consumed.
/// @param args Arguments without the program name.
/// @param opts Accumulator receiving parsed values.
/// @param diags Receives a diagnostic when the result is Error.
OptionParseResult parsePresetOption(int &index,
                                    ArgvView args,
                                    PresetCliOptions &opts,
                                    support::DiagnosticEngine &diags);

/// @brief Parse every argument in @p args.
/// @return True when no error diagnostic was reported.
bool parseArguments(ArgvView args, PresetCliOptions &opts, support::DiagnosticEngine &diags);

/// @brief Print usage information for jsopt-preset.
void printUsage(std::ostream &os);

/// @brief Execute the jsopt-preset workflow with injectable streams.
/// @param argc Argument count including the program name.
/// @param argv Argument vector including the program name.
/// @param out Stream receiving the option listing.
/// @param err Stream receiving diagnostics, usage and trace output.
/// @return Zero on success; one on argument or level errors.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace jsopt::tools::preset
