/**
 * @file cli.h
 * @brief Argument handling for the bguid command line tool
 *
 *   bguid encode <uuid>...
 *   bguid decode [--lowercase] [--strict] <beautiful>...
 *   bguid generate [--count N]
 *
 * Results go to the output stream; usage errors go to the error stream.
 * Conversion errors are reported through spdlog.
 */

#pragma once

#include "bguid/guid/guid_formatter.h"
#include <ostream>
#include <string>
#include <vector>

namespace bguid {
namespace cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONVERSION = 2;

void printUsage(const std::string& program, std::ostream& out);

/**
 * @brief Run one command
 * @param args Full argument list, program name first
 * @param defaults Decode options before --strict is applied
 * @return EXIT_OK, EXIT_USAGE or EXIT_CONVERSION
 */
int run(const std::vector<std::string>& args,
        const guid::DecodeOptions& defaults,
        std::ostream& out, std::ostream& err);

int run(int argc, char* argv[],
        const guid::DecodeOptions& defaults,
        std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace bguid
