//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: options/OptionTable.hpp
// Purpose: Flatten a CompilerOptions record into named entries for dumps and diffs.
// Key invariants: Entry order and names are identical for every record, so two
//                 listings can be compared position by position.
// Ownership/Lifetime: Entries own their strings; records are only read.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "options/CompilerOptions.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace jsopt::options
{

/// @brief One field of a CompilerOptions record in printable form.
struct OptionEntry
{
    std::string name;  ///< Dotted field name, e.g. "inlining.functions".
    std::string value; ///< Lower-case rendering of the field value.
};

/// @brief List every field of @p options in declaration order.
/// @details Warning overrides appear as one "checks.warnings.<group>" entry per
///          diagnostic group, with "default" when no override is set.
std::vector<OptionEntry> listOptions(const CompilerOptions &options);

/// @brief Names of the fields whose values differ between two records.
/// @return Field names in listing order; empty when the records are equal.
std::vector<std::string> diffOptions(const CompilerOptions &before, const CompilerOptions &after);

/// @brief Field-for-field equality of two records.
bool optionsEqual(const CompilerOptions &lhs, const CompilerOptions &rhs);

/// @brief Print every field as "name = value", one per line.
void printOptions(std::ostream &os, const CompilerOptions &options);

/// @brief Print only the fields of @p after that differ from @p before.
void printOptionDiff(std::ostream &os, const CompilerOptions &before, const CompilerOptions &after);

} // namespace jsopt::options
