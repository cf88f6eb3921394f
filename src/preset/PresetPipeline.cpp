//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the caller-side ordering of presets.  The presets themselves are
// total and silent; this layer is where a request becomes a sequence of
// applier calls, where steps are traced, and where unknown level text turns
// into a diagnostic.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Ordering and tracing of preset application.

#include "preset/PresetPipeline.hpp"

#include "preset/AddOnPresets.hpp"
#include "preset/LevelPresets.hpp"

#include <ostream>
#include <string>

namespace jsopt::preset
{

/// @brief Apply the requested presets in their fixed order.
///
/// @details The primary preset runs first.  Debug options follow so they can
///          re-enable assertions the advanced preset removes.  The type-based
///          and wrapped-output add-ons come last; both overwrite fields the
///          primary preset may have set.
void configureOptions(const PresetRequest &request,
                      options::CompilerOptions &options,
                      std::ostream *trace)
{
    if (trace)
        *trace << "[preset] compilation level " << toString(request.level) << '\n';
    applyCompilationLevel(request.level, options);

    if (request.debug)
    {
        if (trace)
            *trace << "[preset] debug options\n";
        applyDebugOptions(options);
    }
    if (request.useTypesForOptimization)
    {
        if (trace)
            *trace << "[preset] type-based optimizations\n";
        applyTypeBasedOptimizations(request.level, options);
    }
    if (request.assumeFunctionWrapper)
    {
        if (trace)
            *trace << "[preset] wrapped output optimizations\n";
        applyWrappedOutputOptimizations(request.level, options);
    }
}

/// @brief Resolve level text and configure a fresh record.
///
/// @details An unrecognised level is the only failure this layer can see; it
///          is returned as an error diagnostic whose origin is the offending
///          text so the caller decides whether to fall back or stop.
support::Expected<options::CompilerOptions> resolvePreset(std::string_view levelText,
                                                          const AddOnFlags &flags,
                                                          std::ostream *trace)
{
    auto level = parseCompilationLevel(levelText);
    if (!level)
    {
        return support::makeError("--compilation_level",
                                  "unknown compilation level '" + std::string(levelText) + "'");
    }

    PresetRequest request;
    request.level = *level;
    request.debug = flags.debug;
    request.useTypesForOptimization = flags.useTypesForOptimization;
    request.assumeFunctionWrapper = flags.assumeFunctionWrapper;

    options::CompilerOptions options;
    configureOptions(request, options, trace);
    return options;
}

} // namespace jsopt::preset
