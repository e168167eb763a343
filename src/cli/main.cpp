#include "castle_browser_profile.hpp"
#include "castle_config.hpp"
#include "castle_csprng.hpp"
#include "castle_error.hpp"
#include "castle_logger.hpp"
#include "castle_token.hpp"
#include "castle_token_inspector.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace castle;

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<int(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<int(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - v11 device fingerprint token generator\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() ? args[index] : default_val;
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static int get_option_int(const std::vector<std::string>& args, const std::string& option, int default_val = 0) {
    std::string val = get_option(args, option);
    if (val.empty()) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return default_val;
    }
}

/// Apply log.* keys of the configuration to the global logger
static void configure_logging(const Config& cfg) {
    auto& logger = Logger::instance();
    logger.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    logger.setConsoleOutput(cfg.getBool("log.console", true));

    const std::string log_file = cfg.get("log.file");
    if (!log_file.empty() && !logger.setFileOutput(log_file)) {
        CASTLE_LOG_WARN("Cannot open log file: " + log_file);
    }
}

// ============================================================================
// Handlers
// ============================================================================

static int handle_generate(const std::vector<std::string>& args) {
    auto& cfg = Config::instance();

    const std::string config_path = get_option(args, "--config");
    if (!config_path.empty() && !cfg.loadFromFile(config_path)) {
        std::cerr << "[-] Cannot read config file: " << config_path << "\n";
        return 1;
    }

    const std::string profile_name = get_option(args, "--profile");
    if (!profile_name.empty()) cfg.set("profile.name", profile_name);

    configure_logging(cfg);

    try {
        const BrowserProfile profile = BrowserProfile::from_config(cfg);
        const std::string user_agent =
            get_option(args, "--ua", cfg.get("token.user_agent", DEFAULT_USER_AGENT));
        const int count = std::max(1, get_option_int(args, "--count", 1));

        // --seed makes the random draws reproducible; the clock still moves
        std::unique_ptr<RandomSource> seeded;
        const std::string seed = get_option(args, "--seed");
        if (!seed.empty()) {
            seeded = std::make_unique<SeededRandomSource>(std::stoull(seed));
            CASTLE_LOG_WARN("Using seeded random source; do not use these tokens for real logins");
        }
        RandomSource& rng = seeded ? *seeded : CSPRNG::default_source();

        TokenGenerator generator(rng);
        for (int i = 0; i < count; ++i) {
            CastleToken t = generator.generate(user_agent, profile);
            std::cout << "token: " << t.token << "\n";
            std::cout << "cuid:  " << t.cuid << "\n";
        }
    } catch (const std::logic_error& e) {
        // unknown profile name, malformed --seed
        std::cerr << "[-] " << e.what() << "\n";
        return 1;
    } catch (const EncodingError& e) {
        CASTLE_LOG_ERROR(std::string("Token encoding failed: ") + e.what());
        return 2;
    }
    return 0;
}

static int handle_inspect(const std::vector<std::string>& args) {
    const std::string token = get_arg(args, 0);
    if (token.empty()) {
        std::cerr << "Usage: castlegen inspect <token>\n";
        return 1;
    }

    try {
        TokenInfo info = inspect_token(token);
        std::printf("version:        0x%02x\n", info.version);
        std::printf("padding:        %u\n", static_cast<unsigned>(info.padding));
        std::printf("sdk version:    0x%04x\n", static_cast<unsigned>(info.sdk_version));
        std::printf("publisher key:  %s\n", info.publisher_key.c_str());
        std::printf("cuid:           %s\n", info.cuid.c_str());
        std::printf("init time:      +%us .%03u (key %x)\n", info.init_time.seconds,
                    info.init_time.millis, static_cast<unsigned>(info.init_time.key_nibble));
        std::printf("send time:      +%us .%03u (key %x)\n", info.send_time.seconds,
                    info.send_time.millis, static_cast<unsigned>(info.send_time.key_nibble));
        std::printf("fingerprint:    %zu bytes\n", info.fingerprint.size());
    } catch (const TokenFormatError& e) {
        std::cerr << "[-] Invalid token: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

static int handle_profiles(const std::vector<std::string>&) {
    for (const auto& name : BrowserProfile::names()) {
        const BrowserProfile p = *BrowserProfile::by_name(name);
        std::cout << name << "\n"
                  << "    " << p.screen_width << "x" << p.screen_height
                  << " (avail " << p.available_width << "x" << p.available_height << "), "
                  << p.hardware_concurrency << " cores, " << p.device_memory_gb << " GB, "
                  << p.timezone << "\n"
                  << "    " << p.gpu_renderer << "\n";
    }
    return 0;
}

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    ArgumentParser parser("castlegen", "v1.0.0");

    parser.add_command("generate", "Generate fingerprint token(s) and cuid", handle_generate,
                       {"[--ua <user-agent>]", "[--profile <name>]", "[--config <file>]",
                        "[--seed <n>]", "[--count <n>]"});
    parser.add_command("inspect", "Decode a token and print its header", handle_inspect, {"<token>"});
    parser.add_command("profiles", "List built-in browser profiles", handle_profiles);

    return parser.parse_and_execute(argc, argv);
}
