// SharePool CLI Simulator
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Drives one ProceedsPool over an in-memory asset token. Commands are read
// interactively, from a script file, or given on the command line.

#include <nlohmann/json.hpp>

#include "sharepool/sharepool.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
using namespace sharepool;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Simulator
//------------------------------------------------------------------------------

class Simulator {
public:
    explicit Simulator(PoolConfig config)
        : config_(std::move(config))
        , token_("ASSET")
        , mover_(token_, config_.custody)
        , event_log_(std::cout, config_.name)
    {
        // Without a configured admin, the label "admin" holds the role
        if (is_zero_address(config_.admin)) {
            config_.admin = allocate("admin");
        }
        pool_ = std::make_unique<ProceedsPool>(mover_, config_);
        set_event_log(config_.log_events);
    }

    void set_event_log(bool enabled) {
        pool_->set_listener(enabled ? &event_log_ : nullptr);
    }

    json execute(const std::vector<std::string>& parts);

private:
    PoolConfig config_;
    AssetToken token_;
    TokenMover mover_;
    std::unique_ptr<ProceedsPool> pool_;
    JsonEventLog event_log_;
    uint64_t next_account_ = 1;

    Address resolve(const std::string& label);
    Address allocate(const std::string& label);

    json status(int32_t rc) const {
        if (rc != errors::OK) {
            return json{{"error", errors::message(rc)}, {"code", rc}};
        }
        return json{{"ok", true}};
    }

    json user_json(const Address& account) const {
        UserInfo info = pool_->user_info(account);
        return json{
            {"account", config_.label(account)},
            {"address", addresses::to_hex(account)},
            {"balance", to_string(info.balance)},
            {"pending_proceeds", to_string(info.pending_proceeds)},
            {"checkpoint", to_string(info.checkpoint)},
            {"locked_proceeds", to_string(info.locked_proceeds)},
            {"asset_balance", to_string(token_.balance_of(account))}
        };
    }
};

Address Simulator::allocate(const std::string& label) {
    Address addr = addresses::from_u64(0x1000 + next_account_++);
    config_.aliases[label] = addr;
    return addr;
}

Address Simulator::resolve(const std::string& label) {
    try {
        return config_.resolve(label);
    } catch (const std::invalid_argument&) {
        // Unknown labels become fresh accounts
        if (label.rfind("0x", 0) == 0) throw;
        return allocate(label);
    }
}

json Simulator::execute(const std::vector<std::string>& parts) {
    const std::string& cmd = parts[0];
    auto need = [&](size_t n, const char* usage) {
        if (parts.size() < n) {
            throw std::invalid_argument(std::string("Usage: ") + usage);
        }
    };

    if (cmd == "mint") {
        need(3, "mint <account> <amount>");
        return status(token_.mint(resolve(parts[1]), parse_u128(parts[2])));
    } else if (cmd == "approve") {
        need(3, "approve <account> <amount|max>");
        U128 amount = parts[2] == "max" ? U128_MAX : parse_u128(parts[2]);
        return status(token_.approve(resolve(parts[1]), config_.custody, amount));
    } else if (cmd == "fund") {
        need(3, "fund <account> <amount>");
        Address account = resolve(parts[1]);
        int32_t rc = token_.mint(account, parse_u128(parts[2]));
        if (rc == errors::OK) {
            rc = token_.approve(account, config_.custody, U128_MAX);
        }
        return status(rc);
    } else if (cmd == "deposit") {
        need(3, "deposit <account> <amount>");
        return status(pool_->deposit(resolve(parts[1]), parse_u128(parts[2])));
    } else if (cmd == "withdraw") {
        need(3, "withdraw <account> <amount>");
        return status(pool_->withdraw(resolve(parts[1]), parse_u128(parts[2])));
    } else if (cmd == "proceeds") {
        need(3, "proceeds <account> <amount>");
        return status(pool_->deposit_proceeds(resolve(parts[1]), parse_u128(parts[2])));
    } else if (cmd == "claim") {
        need(2, "claim <account>");
        return status(pool_->claim_proceeds(resolve(parts[1])));
    } else if (cmd == "transfer") {
        need(4, "transfer <from> <to> <amount>");
        return status(pool_->transfer(resolve(parts[1]), resolve(parts[2]),
                                      parse_u128(parts[3])));
    } else if (cmd == "freeze" || cmd == "unfreeze") {
        need(2, "freeze|unfreeze <account>");
        token_.set_frozen(resolve(parts[1]), cmd == "freeze");
        return status(errors::OK);
    } else if (cmd == "pending") {
        need(2, "pending <account>");
        Address account = resolve(parts[1]);
        return json{{"account", config_.label(account)},
                    {"pending_proceeds", to_string(pool_->pending_proceeds(account))}};
    } else if (cmd == "user") {
        need(2, "user <account>");
        return user_json(resolve(parts[1]));
    } else if (cmd == "info") {
        ContractInfo info = pool_->contract_info();
        return json{
            {"pool", config_.name},
            {"admin", config_.label(config_.admin)},
            {"total_shares", to_string(info.total_shares)},
            {"total_underlying", to_string(info.total_underlying)},
            {"total_proceeds_deposited", to_string(info.total_proceeds_deposited)},
            {"pending_zero_supply_proceeds", to_string(info.pending_zero_supply_proceeds)},
            {"cumulative_reward_per_share", to_string(info.cumulative_reward_per_share)},
            {"total_proceeds_paid", to_string(info.total_proceeds_paid)}
        };
    } else if (cmd == "stats") {
        ProceedsPool::Stats stats = pool_->get_stats();
        return json{
            {"deposits", stats.total_deposits},
            {"withdrawals", stats.total_withdrawals},
            {"injections", stats.total_injections},
            {"settlements", stats.total_settlements},
            {"transfers", stats.total_transfers},
            {"failed", stats.total_failed},
            {"holders", stats.holders},
            {"bonus_paid", to_string(stats.total_bonus_paid)}
        };
    } else if (cmd == "log") {
        need(2, "log on|off");
        set_event_log(parts[1] == "on");
        return status(errors::OK);
    }

    throw std::invalid_argument("Unknown command: " + cmd);
}

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
SharePool CLI Commands:

  fund <account> <amount>           Mint asset and approve the pool (unlimited)
  mint <account> <amount>           Mint asset only
  approve <account> <amount|max>    Approve the pool to pull asset
  deposit <account> <amount>        Deposit asset for claim units (1:1)
  withdraw <account> <amount>       Burn claim units for asset, settle proceeds
  proceeds <account> <amount>       Inject proceeds (admin only)
  claim <account>                   Pay out pending proceeds
  transfer <from> <to> <amount>     Transfer claim units
  freeze|unfreeze <account>         Make asset transfers for an account fail
  pending <account>                 Show pending proceeds
  user <account>                    Show account state
  info                              Show pool state
  stats                             Show operation counters
  log on|off                        Toggle the JSON event log
  help                              Show this help message
  quit / exit                       Exit the CLI

Accounts are config aliases, 0x-prefixed addresses, or new labels.
)";
}

void print_message(const json& msg) {
    if (msg.contains("error")) {
        std::cout << "Error: " << msg["error"].get<std::string>() << "\n";
        return;
    }
    std::cout << msg.dump(2) << "\n";
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

// Returns false when the session should end
bool run_line(Simulator& sim, const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return true;

    auto parts = split(line);
    for (auto& c : parts[0]) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (parts[0] == "quit" || parts[0] == "exit") {
        return false;
    }
    if (parts[0] == "help") {
        print_help();
        return true;
    }

    try {
        print_message(sim.execute(parts));
    } catch (const std::exception& e) {
        std::cout << e.what() << "\n";
    }
    return true;
}

void run_interactive(Simulator& sim) {
    std::cout << "SharePool CLI - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!run_line(sim, line)) {
            std::cout << "Goodbye\n";
            break;
        }
        std::cout << "> ";
    }
}

int run_script(Simulator& sim, const std::string& path, bool verbose) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open script: " << path << "\n";
        return 1;
    }
    std::string line;
    while (std::getline(file, line)) {
        if (verbose) std::cout << ">> " << line << "\n";
        if (!run_line(sim, line)) break;
    }
    return 0;
}

void print_usage(const char* prog) {
    std::cout << "SharePool CLI Simulator\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON pool configuration\n"
              << "  -s, --script <file>  Run commands from a file\n"
              << "  -v, --verbose        Echo script lines\n"
              << "  -h, --help           Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << "                              # Interactive mode\n"
              << "  " << prog << " -c pool.json -s scenario.txt\n";
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
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--script") {
            if (i + 1 >= argc) {
                std::cerr << "Missing script argument\n";
                std::exit(1);
            }
            options.script_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
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

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    PoolConfig config;
    if (!options.config_path.empty()) {
        try {
            config = PoolConfig::from_file(options.config_path);
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    Simulator sim(std::move(config));

    if (!options.script_path.empty()) {
        return run_script(sim, options.script_path, options.verbose);
    }
    if (!options.command_args.empty()) {
        std::string line;
        for (const auto& a : options.command_args) line += a + " ";
        run_line(sim, line);
        return 0;
    }

    run_interactive(sim);
    return 0;
}
