//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the jsopt-preset command line.  Flags are decoded one at a time
// into PresetCliOptions; the level text is resolved only after parsing so an
// unknown level is reported the same way whichever spelling of the flag
// carried it.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses jsopt-preset flags and prints the configured options record.

#include "tools/jsopt-preset/cli.hpp"

#include "options/OptionTable.hpp"
#include "preset/CompilationLevel.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string_view>

namespace jsopt::tools::preset
{
namespace
{

constexpr std::string_view kLevelFlag = "--compilation_level";
constexpr std::string_view kVersion = "jsopt-preset 0.1.0";

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.substr(0, prefix.size()) == prefix;
}

OptionParseResult parseLevelValue(int &index,
                                  ArgvView args,
                                  std::string_view flag,
                                  PresetCliOptions &opts,
                                  support::DiagnosticEngine &diags)
{
    if (index + 1 >= args.size())
    {
        diags.report(support::makeError(std::string(flag), "missing level name"));
        return OptionParseResult::Error;
    }
    opts.level = std::string(args.at(++index));
    return OptionParseResult::Parsed;
}

void printLevels(std::ostream &os)
{
    for (auto level : jsopt::preset::kAllCompilationLevels)
    {
        const char *sep = "";
        for (auto alias : jsopt::preset::levelAliases(level))
        {
            os << sep << alias;
            sep = " ";
        }
        os << '\n';
    }
}

} // namespace

/// @brief Decode the option at @p index.
///
/// @details The level accepts `--compilation_level LEVEL`,
///          `--compilation_level=LEVEL` and `-O LEVEL`.  A level flag with no
///          value is an error; the value itself is checked later.  Anything
///          else that is not a known flag is reported as NotMatched so the
///          caller can word the diagnostic.
OptionParseResult parsePresetOption(int &index,
                                    ArgvView args,
                                    PresetCliOptions &opts,
                                    support::DiagnosticEngine &diags)
{
    const std::string_view arg = args.at(index);
    if (arg == kLevelFlag || arg == "-O")
        return parseLevelValue(index, args, arg, opts, diags);
    if (startsWith(arg, kLevelFlag) && arg.size() > kLevelFlag.size() &&
        arg[kLevelFlag.size()] == '=')
    {
        std::string_view value = arg.substr(kLevelFlag.size() + 1);
        if (value.empty())
        {
            diags.report(support::makeError(std::string(kLevelFlag), "missing level name"));
            return OptionParseResult::Error;
        }
        opts.level = std::string(value);
        return OptionParseResult::Parsed;
    }
    if (arg == "--use_types_for_optimization")
    {
        opts.addOns.useTypesForOptimization = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--assume_function_wrapper")
    {
        opts.addOns.assumeFunctionWrapper = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--debug")
    {
        opts.addOns.debug = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--changed")
    {
        opts.changedOnly = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--trace")
    {
        opts.trace = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--list-levels")
    {
        opts.listLevels = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "-h" || arg == "--help")
    {
        opts.help = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--version")
    {
        opts.version = true;
        return OptionParseResult::Parsed;
    }
    return OptionParseResult::NotMatched;
}

bool parseArguments(ArgvView args, PresetCliOptions &opts, support::DiagnosticEngine &diags)
{
    for (int i = 0; i < args.size(); ++i)
    {
        switch (parsePresetOption(i, args, opts, diags))
        {
            case OptionParseResult::Parsed:
            case OptionParseResult::Error:
                break;
            case OptionParseResult::NotMatched:
            {
                const std::string arg(args.at(i));
                if (startsWith(arg, "-"))
                    diags.report(support::makeError(arg, "unknown option"));
                else
                    diags.report(support::makeError(arg, "unexpected argument"));
                break;
            }
        }
    }
    return diags.errorCount() == 0;
}

void printUsage(std::ostream &os)
{
    os << "Usage: jsopt-preset [options]\n"
       << "Print the compiler options selected by a compilation level.\n\n"
       << "  --compilation_level, -O LEVEL  BUNDLE, WHITESPACE_ONLY, SIMPLE_OPTIMIZATIONS\n"
       << "                                 or ADVANCED_OPTIMIZATIONS (default SIMPLE)\n"
       << "  --use_types_for_optimization   Enable type-based optimizations\n"
       << "  --assume_function_wrapper      Output is wrapped in a function\n"
       << "  --debug                        Readable names, keep assertions\n"
       << "  --changed                      Print only options that differ from defaults\n"
       << "  --trace                        Print applied presets to stderr\n"
       << "  --list-levels                  Print levels and their aliases\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n";
}

/// @brief Run the tool.
///
/// @details Help, version and the level table short-circuit before the level
///          is resolved.  Otherwise the options record is configured from the
///          parsed request and written to @p out, either in full or as the
///          fields changed from a default record.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    ArgvView args{argc, argv};
    PresetCliOptions opts;
    support::DiagnosticEngine diags;
    if (!parseArguments(args.drop_front(), opts, diags))
    {
        diags.printAll(err);
        printUsage(err);
        return 1;
    }

    if (opts.help)
    {
        printUsage(out);
        return 0;
    }
    if (opts.version)
    {
        out << kVersion << '\n';
        return 0;
    }
    if (opts.listLevels)
    {
        printLevels(out);
        return 0;
    }

    std::ostream *trace = opts.trace ? &err : nullptr;
    auto resolved = jsopt::preset::resolvePreset(opts.level, opts.addOns, trace);
    if (!resolved)
    {
        support::printDiag(resolved.error(), err);
        return 1;
    }

    if (opts.changedOnly)
        options::printOptionDiff(out, options::CompilerOptions{}, resolved.value());
    else
        options::printOptions(out, resolved.value());
    return 0;
}

} // namespace jsopt::tools::preset
