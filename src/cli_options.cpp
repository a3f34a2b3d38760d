#include "cli_options.hpp"
#include <cmath>
#include <iostream>

namespace {

double parse_seconds(const std::string& option, const std::string& raw) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &consumed);
    } catch (const std::exception&) {
        throw CliUsageError(option + " expects a number, got '" + raw + "'");
    }
    if (consumed != raw.size() || !std::isfinite(value))
        throw CliUsageError(option + " expects a number, got '" + raw + "'");
    if (value <= 0)
        throw CliUsageError(option + " must be positive");
    return value;
}

} // namespace

CliOptions parse_cli(int argc, const char* const argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--features") {
            options.print_features = true;
        } else if (arg == "--json") {
            if (i + 1 >= argc)
                throw CliUsageError("--json expects a path");
            options.json_path = argv[++i];
        } else if (arg == "--max-duration") {
            if (i + 1 >= argc)
                throw CliUsageError("--max-duration expects a number of seconds");
            options.max_duration = parse_seconds(arg, argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (!arg.empty() && arg[0] == '-') {
            throw CliUsageError("unknown option '" + arg + "'");
        } else {
            options.inputs.push_back(arg);
        }
    }
    if (options.inputs.empty())
        throw CliUsageError("no input files");
    return options;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <audio_file>... [--features] [--json <output.json>] [--max-duration <seconds>]" << std::endl;
    std::cerr << "Classifies each recording as AI_GENERATED or HUMAN." << std::endl;
    std::cerr << "Environment: VOICEGUARD_MAX_DURATION_SECONDS, VOICEGUARD_TARGET_SAMPLE_RATE, VOICEGUARD_MAX_FILE_MB" << std::endl;
}
