// Depth Stable CLI Simulator
// SPDX-License-Identifier: MIT
//
// Runs a StabilityEngine against an in-process native bank and a manually
// set price feed. Results are printed to stdout as JSON; engine events are
// logged to stderr.

#include "depth/config.hpp"
#include "depth/engine.hpp"
#include "depth/errors.hpp"
#include "depth/hooks.hpp"
#include "depth/native.hpp"
#include "depth/price_feed.hpp"
#include "depth/wad.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace depth;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;
    bool verbose = false;
    bool interactive = true;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Logging
//------------------------------------------------------------------------------

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug") return LogLevel::Debug;
    if (level == "warn") return LogLevel::Warn;
    if (level == "error") return LogLevel::Error;
    return LogLevel::Info;
}

class Logger {
public:
    explicit Logger(LogLevel level) : level_(level) {}

    void debug(const std::string& msg) const { write(LogLevel::Debug, "debug", msg); }
    void info(const std::string& msg) const { write(LogLevel::Info, "info", msg); }
    void warn(const std::string& msg) const { write(LogLevel::Warn, "warn", msg); }
    void error(const std::string& msg) const { write(LogLevel::Error, "error", msg); }

private:
    LogLevel level_;

    void write(LogLevel level, const char* tag, const std::string& msg) const {
        if (level < level_) return;
        std::cerr << "[" << tag << "] " << msg << "\n";
    }
};

// Engine events to the log
class LogHooks : public IEngineHooks {
public:
    explicit LogHooks(const Logger& log) : log_(log) {}

    void on_stable_minted(const Address& caller, I128 native_in, I128 fee, I128 minted) override {
        log_.info("minted " + wad::to_string(minted) + " DUSD to " + addresses::to_hex(caller) +
                  " for " + wad::to_string(native_in) + " native (fee " + wad::to_string(fee) + ")");
    }

    void on_stable_burned(const Address& caller, I128 burned, I128 fee, I128 refunded) override {
        log_.info("burned " + wad::to_string(burned) + " DUSD from " + addresses::to_hex(caller) +
                  ", refunded " + wad::to_string(refunded) + " native (fee " + wad::to_string(fee) + ")");
    }

    void on_buffer_pool_created(const Address& creator) override {
        log_.info("buffer pool created by " + addresses::to_hex(creator));
    }

    void on_buffer_minted(const Address& caller, I128 native_in, I128 minted, I128 price_wad) override {
        log_.info("minted " + wad::to_string(minted) + " DPC to " + addresses::to_hex(caller) +
                  " for " + wad::to_string(native_in) + " native at " + wad::to_string(price_wad) +
                  " DPC per DUSD of surplus");
    }

    void on_buffer_burned(const Address& caller, I128 burned, I128 refunded, I128 price_wad) override {
        log_.info("burned " + wad::to_string(burned) + " DPC from " + addresses::to_hex(caller) +
                  ", refunded " + wad::to_string(refunded) + " native at " + wad::to_string(price_wad) +
                  " DPC per DUSD of surplus");
    }

    void on_transfer(const std::string& symbol, const Address& from, const Address& to, I128 amount) override {
        log_.debug("transfer " + wad::to_string(amount) + " " + symbol + " " +
                   addresses::to_hex(from) + " -> " + addresses::to_hex(to));
    }

    void on_operation_rejected(const std::string& operation, ErrorCode code, const std::string& reason) override {
        log_.warn(operation + " rejected (" + to_string(code) + "): " + reason);
    }

private:
    const Logger& log_;
};

//------------------------------------------------------------------------------
// Simulator
//------------------------------------------------------------------------------

// Accounts are given as 0x-prefixed hex or as a small integer id
Address parse_account(const std::string& s) {
    if (auto addr = addresses::from_hex(s)) {
        return *addr;
    }
    size_t pos = 0;
    unsigned long long id = std::stoull(s, &pos);
    if (pos != s.size() || id == 0) {
        throw std::invalid_argument("invalid account '" + s + "'");
    }
    return addresses::from_id(id);
}

class Simulator {
public:
    Simulator(const Config& config, const Logger& log)
        : config_(config)
        , log_(log)
        , hooks_(log)
        , price_feed_(config.engine.price_feed_owner, config.engine.initial_price_x18)
        , engine_(config.engine, price_feed_, bank_, &hooks_)
    {
        for (const auto& alloc : config.engine.genesis) {
            if (alloc.amount > 0) {
                bank_.fund(alloc.account, alloc.amount);
            }
        }
        log_.debug("engine " + addresses::to_hex(engine_.address()) + " started, fee " +
                   std::to_string(engine_.fee_rate_percentage()) + "%, price " +
                   wad::to_string(price_feed_.current_price()));
    }

    json fund(const Address& account, I128 amount) {
        bank_.fund(account, amount);
        return {{"account", addresses::to_hex(account)}, {"native", wad::to_string(bank_.balance_of(account))}};
    }

    json mint(const Address& caller, I128 native_value) {
        I128 minted = engine_.mint_stable(caller, native_value);
        return {{"minted", wad::to_string(minted)}, {"symbol", StabilityEngine::STABLE_SYMBOL}};
    }

    json burn(const Address& caller, I128 amount) {
        I128 refunded = engine_.burn_stable(caller, amount);
        return {{"refunded", wad::to_string(refunded)}};
    }

    json deposit(const Address& caller, I128 native_value) {
        I128 minted = engine_.deposit_buffer(caller, native_value);
        return {{"minted", wad::to_string(minted)}, {"symbol", StabilityEngine::BUFFER_SYMBOL}};
    }

    json withdraw(const Address& caller, I128 amount) {
        I128 refunded = engine_.withdraw_buffer(caller, amount);
        return {{"refunded", wad::to_string(refunded)}};
    }

    json transfer(const std::string& symbol, const Address& from, const Address& to, I128 amount) {
        if (symbol == StabilityEngine::STABLE_SYMBOL) {
            engine_.transfer_stable(from, to, amount);
        } else if (symbol == StabilityEngine::BUFFER_SYMBOL) {
            engine_.transfer_buffer(from, to, amount);
        } else {
            throw std::invalid_argument("unknown token '" + symbol + "' (expected DUSD or DPC)");
        }
        return {{"transferred", wad::to_string(amount)}, {"symbol", symbol}};
    }

    json set_price(I128 price_x18) {
        price_feed_.set_price(config_.engine.price_feed_owner, price_x18);
        return {{"price", wad::to_string(price_feed_.current_price())}};
    }

    json balance(const Address& account) const {
        return {
            {"account", addresses::to_hex(account)},
            {"native", wad::to_string(bank_.balance_of(account))},
            {"DUSD", wad::to_string(engine_.stable_balance_of(account))},
            {"DPC", wad::to_string(engine_.buffer_balance_of(account))}
        };
    }

    json status() const {
        auto unit_price = engine_.buffer_unit_price();
        return {
            {"engine", addresses::to_hex(engine_.address())},
            {"price", wad::to_string(price_feed_.current_price())},
            {"fee_rate_percentage", engine_.fee_rate_percentage()},
            {"collateral", wad::to_string(engine_.collateral())},
            {"stable_total_supply", wad::to_string(engine_.stable_total_supply())},
            {"deficit_or_surplus", wad::to_string(engine_.deficit_or_surplus())},
            {"buffer_pool", engine_.has_buffer_pool()},
            {"buffer_total_supply", wad::to_string(engine_.buffer_total_supply())},
            {"buffer_unit_price", unit_price ? json(wad::to_string(*unit_price)) : json(nullptr)},
            {"hook_failures", engine_.hook_failures()}
        };
    }

private:
    Config config_;
    const Logger& log_;
    LogHooks hooks_;
    NativeBank bank_;
    ManualPriceFeed price_feed_;
    StabilityEngine engine_;
};

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
Depth Stable Commands:

  fund <account> <native>
    Example: fund 1 10

  mint <account> <native>
    Example: mint 1 1

  burn <account> <dusd>
    Example: burn 1 3900

  deposit <account> <native>
    Example: deposit 2 0.5

  withdraw <account> <dpc>
    Example: withdraw 2 400

  transfer <DUSD|DPC> <from> <to> <amount>
    Example: transfer DUSD 1 2 100

  set_price <price>
    Example: set_price 3500

  balance <account>
    Show native, DUSD and DPC balances

  status
    Show collateral, supplies and surplus

  help
    Show this help message

  quit / exit
    Exit the CLI

Accounts are 0x-prefixed addresses or integer ids. Amounts are decimals.
)";
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

void require_args(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

// Runs one command. Throws StabilityError from the engine and
// std::invalid_argument / std::out_of_range for malformed input.
json execute_command(Simulator& sim, const std::vector<std::string>& args) {
    std::string cmd = lowercase(args[0]);

    if (cmd == "fund") {
        require_args(args, 3, "fund <account> <native>");
        return sim.fund(parse_account(args[1]), wad::parse(args[2]));
    } else if (cmd == "mint") {
        require_args(args, 3, "mint <account> <native>");
        return sim.mint(parse_account(args[1]), wad::parse(args[2]));
    } else if (cmd == "burn") {
        require_args(args, 3, "burn <account> <dusd>");
        return sim.burn(parse_account(args[1]), wad::parse(args[2]));
    } else if (cmd == "deposit") {
        require_args(args, 3, "deposit <account> <native>");
        return sim.deposit(parse_account(args[1]), wad::parse(args[2]));
    } else if (cmd == "withdraw") {
        require_args(args, 3, "withdraw <account> <dpc>");
        return sim.withdraw(parse_account(args[1]), wad::parse(args[2]));
    } else if (cmd == "transfer") {
        require_args(args, 5, "transfer <DUSD|DPC> <from> <to> <amount>");
        std::string symbol = args[1];
        for (auto& c : symbol) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return sim.transfer(symbol, parse_account(args[2]), parse_account(args[3]), wad::parse(args[4]));
    } else if (cmd == "set_price") {
        require_args(args, 2, "set_price <price>");
        return sim.set_price(wad::parse(args[1]));
    } else if (cmd == "balance") {
        require_args(args, 2, "balance <account>");
        return sim.balance(parse_account(args[1]));
    } else if (cmd == "status") {
        return sim.status();
    }
    throw std::invalid_argument("unknown command: " + cmd + ". Type 'help' for commands.");
}

json error_json(const StabilityError& e) {
    return {
        {"error", to_string(e.code())},
        {"code", static_cast<int32_t>(e.code())},
        {"message", e.what()}
    };
}

void run_interactive(Simulator& sim, std::istream& in, bool prompt) {
    if (prompt) std::cout << "Depth Stable CLI - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            if (prompt) std::cout << "> ";
            continue;
        }

        auto parts = split(line);
        std::string cmd = lowercase(parts[0]);

        if (cmd == "help") {
            print_help();
        } else if (cmd == "quit" || cmd == "exit") {
            if (prompt) std::cout << "Goodbye\n";
            break;
        } else {
            try {
                std::cout << execute_command(sim, parts).dump(2) << "\n";
            } catch (const StabilityError& e) {
                std::cout << error_json(e).dump(2) << "\n";
            } catch (const std::invalid_argument& e) {
                std::cout << "Error: " << e.what() << "\n";
            } catch (const std::out_of_range& e) {
                std::cout << "Error: " << e.what() << "\n";
            }
        }

        if (prompt) std::cout << "> ";
    }
}

int run_command(Simulator& sim, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "No command specified. Use -h for help.\n";
        return 1;
    }

    try {
        std::cout << execute_command(sim, args).dump(2) << "\n";
    } catch (const StabilityError& e) {
        std::cout << error_json(e).dump(2) << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}

void print_usage(const char* prog) {
    std::cout << "Depth Stable CLI Simulator\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON configuration file\n"
              << "  -s, --script <file>  Run commands from a file, one per line\n"
              << "  -i, --interactive    Interactive mode (default if no command)\n"
              << "  -v, --verbose        Log at debug level\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  fund <account> <native>\n"
              << "  mint <account> <native>\n"
              << "  burn <account> <dusd>\n"
              << "  deposit <account> <native>\n"
              << "  withdraw <account> <dpc>\n"
              << "  transfer <DUSD|DPC> <from> <to> <amount>\n"
              << "  set_price <price>\n"
              << "  balance <account>\n"
              << "  status\n\n"
              << "Examples:\n"
              << "  " << prog << " -c engine.json -i          # Interactive mode\n"
              << "  " << prog << " -c engine.json -s run.txt  # Scripted session\n"
              << "  " << prog << " -c engine.json status\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config file argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--script") {
            if (i + 1 >= argc) {
                std::cerr << "Missing script file argument\n";
                std::exit(1);
            }
            options.script_path = argv[++i];
        } else if (arg == "-i" || arg == "--interactive") {
            options.interactive = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            options.interactive = false;
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    // Default to interactive if no command
    if (options.command_args.empty()) {
        options.interactive = true;
    }

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    Config config;
    try {
        if (!options.config_path.empty()) {
            config = Config::from_file(options.config_path);
        } else {
            config.validate();
        }
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    if (options.verbose) {
        config.set_log_level("debug");
    }

    Logger log(parse_log_level(config.general.log_level));

    std::unique_ptr<Simulator> sim;
    try {
        sim = std::make_unique<Simulator>(config, log);
    } catch (const StabilityError& e) {
        log.error(std::string("failed to start engine: ") + e.what());
        return 1;
    }

    if (!options.script_path.empty()) {
        std::ifstream script{options.script_path};
        if (!script.is_open()) {
            log.error("cannot open script file: " + options.script_path);
            return 1;
        }
        run_interactive(*sim, script, false);
        return 0;
    }

    // Run in interactive or command mode
    if (options.interactive) {
        run_interactive(*sim, std::cin, true);
        return 0;
    }
    return run_command(*sim, options.command_args);
}
