#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP
#include <stdexcept>
#include <string>
#include <vector>

class CliUsageError : public std::runtime_error {
public:
    explicit CliUsageError(const std::string& what) : std::runtime_error(what) {}
};

struct CliOptions {
    std::vector<std::string> inputs;
    bool print_features = false;
    bool show_help = false;
    std::string json_path;
    double max_duration = 0.0; // 0 keeps the configured analysis window
};

/**
 * @brief Parses `<audio_file>... [--features] [--json <path>] [--max-duration <seconds>]`.
 *
 * @throws CliUsageError on an unknown option, a missing or malformed option
 *         value, or when no input file is given.
 */
CliOptions parse_cli(int argc, const char* const argv[]);

void print_usage(const char* program);

#endif
