//===----------------------------------------------------------------------===//
//
// Part of the JSOpt project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the `jsopt-preset` binary.  All work happens in runCLI so
// tests can drive the tool with string streams.
//
//===----------------------------------------------------------------------===//

#include "tools/jsopt-preset/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return jsopt::tools::preset::runCLI(argc, argv, std::cout, std::cerr);
}
