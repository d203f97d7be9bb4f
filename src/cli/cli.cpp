/**
 * @file cli.cpp
 * @brief Implementation of the bguid command line
 */

#include "bguid/cli/cli.h"
#include "bguid/common/exceptions.h"
#include "bguid/common/logger.h"
#include "bguid/guid/uuid.h"
#include "bguid/utils/string_utils.h"
#include <set>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace bguid {
namespace cli {

namespace {

struct Invocation {
    std::string command;
    bool lowercase = false;
    bool strict = false;
    int count = 1;
    std::set<std::string> seen;
    std::vector<std::string> args;
};

// Options each command understands
const std::set<std::string>& allowedOptions(const std::string& command) {
    static const std::set<std::string> none;
    static const std::set<std::string> decode = {"--lowercase", "--strict"};
    static const std::set<std::string> generate = {"--count"};
    if (command == "decode") {
        return decode;
    }
    if (command == "generate") {
        return generate;
    }
    return none;
}

bool parseCount(const std::string& text, int& count) {
    try {
        size_t pos = 0;
        count = std::stoi(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

int usageError(const std::string& program, const std::string& message, std::ostream& err) {
    err << program << ": " << message << "\n";
    printUsage(program, err);
    return EXIT_USAGE;
}

} // anonymous namespace

void printUsage(const std::string& program, std::ostream& out) {
    out << "Usage: " << program << " <command> [options] [args...]\n";
    out << "Commands:\n";
    out << "  encode <uuid>...          Print the beautiful form of each UUID\n";
    out << "  decode <beautiful>...     Print the canonical UUID of each beautiful GUID\n";
    out << "  generate [--count N]      Print N random UUIDs with their beautiful form\n";
    out << "Options:\n";
    out << "  --lowercase               Print decoded UUIDs in lowercase (decode)\n";
    out << "  --strict                  Reject input with more than four groups (decode)\n";
    out << "  --count N                 Number of UUIDs to generate (generate)\n";
    out << "  --help                    Show this message\n";
}

int run(const std::vector<std::string>& args,
        const guid::DecodeOptions& defaults,
        std::ostream& out, std::ostream& err) {
    const std::string program = args.empty() ? "bguid" : args[0];

    if (args.size() < 2) {
        return usageError(program, "missing command", err);
    }

    Invocation inv;
    inv.command = args[1];
    if (inv.command == "--help" || inv.command == "-h") {
        printUsage(program, out);
        return EXIT_OK;
    }
    if (inv.command != "encode" && inv.command != "decode" && inv.command != "generate") {
        return usageError(program, "unknown command '" + inv.command + "'", err);
    }

    const auto& allowed = allowedOptions(inv.command);
    for (size_t i = 2; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(program, out);
            return EXIT_OK;
        }
        if (arg.compare(0, 2, "--") != 0) {
            inv.args.push_back(arg);
            continue;
        }
        if (allowed.count(arg) == 0) {
            return usageError(program, "option " + arg + " is not valid for " + inv.command, err);
        }
        if (!inv.seen.insert(arg).second) {
            return usageError(program, "option " + arg + " given more than once", err);
        }

        if (arg == "--lowercase") {
            inv.lowercase = true;
        } else if (arg == "--strict") {
            inv.strict = true;
        } else if (arg == "--count") {
            if (i + 1 >= args.size()) {
                return usageError(program, "--count needs a value", err);
            }
            const std::string& value = args[++i];
            if (!parseCount(value, inv.count)) {
                return usageError(program, "invalid --count value '" + value + "'", err);
            }
            if (inv.count < 1) {
                return usageError(program, "--count must be positive, got " + value, err);
            }
        }
    }

    if (inv.command == "generate" && !inv.args.empty()) {
        return usageError(program, "generate takes no arguments", err);
    }
    if (inv.command != "generate" && inv.args.empty()) {
        return usageError(program, inv.command + " needs at least one argument", err);
    }

    guid::DecodeOptions options = defaults;
    if (inv.strict) {
        options.allowExtraSegments = false;
    }

    try {
        if (inv.command == "encode") {
            for (const auto& arg : inv.args) {
                out << guid::toBeautiful(arg) << "\n";
            }
        } else if (inv.command == "decode") {
            for (const auto& arg : inv.args) {
                std::string uuid = guid::fromBeautiful(arg, options);
                out << (inv.lowercase ? utils::toLower(uuid) : uuid) << "\n";
            }
        } else {
            for (int i = 0; i < inv.count; i++) {
                guid::Uuid uuid = guid::Uuid::generate();
                out << uuid.toString() << " " << guid::toBeautiful(uuid) << "\n";
            }
        }
    } catch (const common::BeautifulGuidException& e) {
        spdlog::error("[{}] {}", e.getCode(), e.what());
        common::Logger::flush();
        return EXIT_CONVERSION;
    }

    return EXIT_OK;
}

int run(int argc, char* argv[],
        const guid::DecodeOptions& defaults,
        std::ostream& out, std::ostream& err) {
    return run(std::vector<std::string>(argv, argv + argc), defaults, out, err);
}

} // namespace cli
} // namespace bguid
