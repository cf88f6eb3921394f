//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jsopt/options/CompilerOptions.hpp
// Purpose: Public view of the compiler options record and its flat listing.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "options/CompilerOptions.hpp"
#include "options/OptionTable.hpp"
