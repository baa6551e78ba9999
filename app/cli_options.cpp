#include <string_view>

#include "cli_options.hpp"
#include "errors.hpp"

CliOptions parseCliOptions(int argc, const char* const argv[], const std::string& defaultConfigPath) {
    CliOptions options;
    options.configPath = defaultConfigPath;

    for (int i = 1; i < argc; i++) {
        const std::string_view arg(argv[i]);

        if (arg == "--json") {
            options.asJson = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                throw InvalidArgument("--config requires a path");
            }
            options.configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (!arg.empty() && arg.front() == '-') {
            throw InvalidArgument("Unknown option: " + std::string(arg));
        } else {
            options.currencies.emplace_back(std::string(arg));
        }
    }

    return options;
}
