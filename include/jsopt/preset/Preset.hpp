//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jsopt/preset/Preset.hpp
// Purpose: Public entry point for compilation-level presets.
// Key invariants: Presets write only into the caller's CompilerOptions.
// Ownership/Lifetime: Header-only façade over the preset library.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "preset/AddOnPresets.hpp"
#include "preset/CompilationLevel.hpp"
#include "preset/LevelPresets.hpp"
#include "preset/PresetPipeline.hpp"
