// VELEDGER - Ledger Simulator
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Builds a ledger from configuration and replays a line-oriented script
// against it on a manual clock.
//
// Usage: veledger-sim [-conf=FILE] [-script=FILE] [-datadir=DIR] [-debug=CAT]

#include "veledger/asset/token_ledger.h"
#include "veledger/core/errors.h"
#include "veledger/crypto/hash.h"
#include "veledger/db/ledger_store.h"
#include "veledger/escrow/voting_escrow.h"
#include "veledger/node/node_registry.h"
#include "veledger/rewards/reward_engine.h"
#include "veledger/util/clock.h"
#include "veledger/util/config.h"
#include "veledger/util/logging.h"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace veledger {

namespace {

constexpr const char* CLIENT_NAME = "veledger-sim";
constexpr const char* VERSION = "1.0.0";

/// Default simulated start time (2023-11-14 22:13:20 UTC)
constexpr Timestamp DEFAULT_START_TIME = 1700000000;

/// Reward supply minted to the reward engine at start-up, in tokens
constexpr int64_t DEFAULT_REWARD_FUND_TOKENS = 1000000;

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: veledger-sim [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                 Show this help message\n";
    std::cout << "  -conf=FILE            Config file (default: <datadir>/veledger.conf)\n";
    std::cout << "  -datadir=DIR          Data directory (default: current directory)\n";
    std::cout << "  -script=FILE          Script to run (default: standard input)\n";
    std::cout << "  -starttime=TS         Initial clock value (default: 1700000000)\n";
    std::cout << "  -debug=CATEGORY       Enable debug output (escrow,rewards,db,... or all)\n";
    std::cout << "  -loglevel=LEVEL       trace, debug, info, warn, error\n";
    std::cout << "  -printtoconsole=0/1   Log to the console (default: 1)\n";
    std::cout << "\nScript commands (amounts in tokens, durations as N[s|d|w|y], default days):\n";
    std::cout << "  fund <account> <amount>\n";
    std::cout << "  lock <account> <amount> <duration> [nonvoting]\n";
    std::cout << "  increase <account> <id> <amount>\n";
    std::cout << "  extend <account> <id> <duration>\n";
    std::cout << "  merge <account> <from> <to>\n";
    std::cout << "  split <account> <id> <amount>\n";
    std::cout << "  withdraw <account> <id>\n";
    std::cout << "  liquidate <account> <id>\n";
    std::cout << "  transfer <account> <to> <id>\n";
    std::cout << "  delegate <account> <delegatee>\n";
    std::cout << "  attach <id> | detach <id> | quality <id> <0..10>\n";
    std::cout << "  advance <duration>\n";
    std::cout << "  power <id> [timestamp]\n";
    std::cout << "  supply [timestamp]\n";
    std::cout << "  votes <account> [timestamp]\n";
    std::cout << "  balance <account>\n";
    std::cout << "  claim <account> <id> | compound <account> <id> | unclaimed <id>\n";
    std::cout << "  save | load\n";
    std::cout << "\nAccounts are names (hashed to an address) or 0x-prefixed hex.\n";
}

/// Parse "N", "Ns", "Nd", "Nw" or "Ny" into seconds (no suffix means days)
Timestamp ParseDuration(const std::string& text) {
    if (text.empty()) {
        throw PreconditionError(ErrorCode::InvalidArgument, "empty duration");
    }
    Timestamp unit = DAY;
    std::string digits = text;
    switch (text.back()) {
        case 's': unit = 1; digits.pop_back(); break;
        case 'd': unit = DAY; digits.pop_back(); break;
        case 'w': unit = WEEK; digits.pop_back(); break;
        case 'y': unit = 365 * DAY; digits.pop_back(); break;
        default: break;
    }
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(digits, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != digits.size() || n < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "bad duration '" + text + "'");
    }
    return SafeCast<Timestamp>(CheckedMul(static_cast<Amount>(n), static_cast<Amount>(unit)));
}

Amount ParseTokens(const std::string& text) {
    Amount amount = 0;
    if (!ParseAmount(text, amount)) {
        throw PreconditionError(ErrorCode::InvalidArgument, "bad amount '" + text + "'");
    }
    return amount;
}

uint64_t ParseNumber(const std::string& text) {
    size_t pos = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(text, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        throw PreconditionError(ErrorCode::InvalidArgument, "bad number '" + text + "'");
    }
    return n;
}

/// Names hash to a stable address; "0x..." is taken literally
Address AccountOf(const std::string& name) {
    if (name.size() > 2 && name[0] == '0' && (name[1] == 'x' || name[1] == 'X')) {
        Address addr = Address::FromHex(name);
        if (addr.IsNull()) {
            throw PreconditionError(ErrorCode::InvalidArgument, "bad address '" + name + "'");
        }
        return addr;
    }
    Hash256 hash = crypto::HashWriter().Write("veledger.account").Write(name).GetHash();
    return Address(hash.data() + hash.size() - Address::SIZE, Address::SIZE);
}

// ============================================================================
// Simulator
// ============================================================================

class Simulator {
public:
    Simulator(const util::ConfigManager& config, const std::filesystem::path& datadir,
              Timestamp start)
        : clock_(start),
          token_("TOKEN"),
          escrowAddress_(AccountOf("escrow")),
          rewardsAddress_(AccountOf("rewards")),
          escrowCustody_(token_.Custody(escrowAddress_)),
          rewardsCustody_(token_.Custody(rewardsAddress_)),
          escrow_(LedgerConfigFrom(config), clock_, *escrowCustody_, escrowAddress_),
          rewards_(rewards::RewardsConfig::FromConfig(config), escrow_, clock_,
                   *rewardsCustody_, rewardsAddress_),
          storeConfig_(db::StoreConfig::FromConfig(config, datadir)) {
        const Address& gov = escrow_.Governance();
        escrow_.SetRewardsOracle(gov, &rewards_);
        escrow_.SetNodeProperties(gov, &nodes_);
        rewards_.SetNodeProperties(gov, &nodes_);

        token_.Mint(rewardsAddress_, static_cast<Amount>(DEFAULT_REWARD_FUND_TOKENS) * COIN);

        escrow_.AddListener([](const escrow::EscrowEvent& event) {
            LOG_DEBUG(util::LogCategory::ESCROW) << "event " << event.ToString();
        });
        rewards_.AddListener([](const rewards::ClaimEvent& event) {
            std::cout << "  " << event.ToString() << "\n";
        });

        RegisterCommands();
    }

    /// Run every line of `in`; failures are reported and the script continues
    int Run(std::istream& in) {
        std::string line;
        int lineNum = 0;
        int failures = 0;
        while (std::getline(in, line)) {
            ++lineNum;
            std::vector<std::string> args = Tokenize(line);
            if (args.empty()) continue;

            std::cout << "[" << clock_.Now() << "] " << line << "\n";
            auto it = commands_.find(args[0]);
            if (it == commands_.end()) {
                std::cout << "  error: unknown command '" << args[0] << "'\n";
                ++failures;
                continue;
            }
            try {
                it->second(args);
            } catch (const LedgerError& e) {
                ++failures;
                std::cout << "  error(" << ErrorCodeToString(e.code()) << "): " << e.what() << "\n";
                LOG_WARN(util::LogCategory::DEFAULT)
                    << "Script line " << lineNum << " failed: " << e.what();
            }
        }
        return failures;
    }

private:
    using Args = std::vector<std::string>;
    using Command = std::function<void(const Args&)>;

    static escrow::LedgerConfig LedgerConfigFrom(const util::ConfigManager& config) {
        escrow::LedgerConfig cfg = escrow::LedgerConfig::FromConfig(config);
        if (cfg.governance.IsNull()) {
            cfg.governance = AccountOf("governance");
        }
        return cfg;
    }

    static std::vector<std::string> Tokenize(const std::string& line) {
        std::vector<std::string> out;
        std::istringstream iss(line.substr(0, line.find('#')));
        std::string word;
        while (iss >> word) out.push_back(word);
        return out;
    }

    static void Expect(const Args& args, size_t min, size_t max, const char* usage) {
        if (args.size() < min || args.size() > max) {
            throw PreconditionError(ErrorCode::InvalidArgument, std::string("usage: ") + usage);
        }
    }

    Timestamp OptionalTime(const Args& args, size_t index) const {
        return args.size() > index ? static_cast<Timestamp>(ParseNumber(args[index])) : clock_.Now();
    }

    void RegisterCommands() {
        commands_["fund"] = [this](const Args& a) {
            Expect(a, 3, 3, "fund <account> <amount>");
            token_.Mint(AccountOf(a[1]), ParseTokens(a[2]));
            std::cout << "  balance " << FormatAmount(token_.BalanceOf(AccountOf(a[1]))) << "\n";
        };
        commands_["lock"] = [this](const Args& a) {
            Expect(a, 4, 5, "lock <account> <amount> <duration> [nonvoting]");
            bool nonVoting = a.size() == 5 && a[4] == "nonvoting";
            TokenId id = escrow_.CreateLock(AccountOf(a[1]), ParseTokens(a[2]),
                                            ParseDuration(a[3]), nonVoting);
            PrintPosition(id);
        };
        commands_["increase"] = [this](const Args& a) {
            Expect(a, 4, 4, "increase <account> <id> <amount>");
            TokenId id = ParseNumber(a[2]);
            escrow_.IncreaseAmount(AccountOf(a[1]), id, ParseTokens(a[3]));
            PrintPosition(id);
        };
        commands_["extend"] = [this](const Args& a) {
            Expect(a, 4, 4, "extend <account> <id> <duration>");
            TokenId id = ParseNumber(a[2]);
            escrow_.IncreaseUnlockTime(AccountOf(a[1]), id, ParseDuration(a[3]));
            PrintPosition(id);
        };
        commands_["merge"] = [this](const Args& a) {
            Expect(a, 4, 4, "merge <account> <from> <to>");
            TokenId to = ParseNumber(a[3]);
            escrow_.Merge(AccountOf(a[1]), ParseNumber(a[2]), to);
            PrintPosition(to);
        };
        commands_["split"] = [this](const Args& a) {
            Expect(a, 4, 4, "split <account> <id> <amount>");
            TokenId id = ParseNumber(a[2]);
            TokenId created = escrow_.Split(AccountOf(a[1]), id, ParseTokens(a[3]));
            PrintPosition(id);
            PrintPosition(created);
        };
        commands_["withdraw"] = [this](const Args& a) {
            Expect(a, 3, 3, "withdraw <account> <id>");
            Address caller = AccountOf(a[1]);
            escrow_.Withdraw(caller, ParseNumber(a[2]));
            std::cout << "  balance " << FormatAmount(token_.BalanceOf(caller)) << "\n";
        };
        commands_["liquidate"] = [this](const Args& a) {
            Expect(a, 3, 3, "liquidate <account> <id>");
            Amount penalty = escrow_.Liquidate(AccountOf(a[1]), ParseNumber(a[2]));
            std::cout << "  penalty " << FormatAmount(penalty) << "\n";
        };
        commands_["transfer"] = [this](const Args& a) {
            Expect(a, 4, 4, "transfer <account> <to> <id>");
            Address from = AccountOf(a[1]);
            escrow_.TransferFrom(from, from, AccountOf(a[2]), ParseNumber(a[3]));
        };
        commands_["delegate"] = [this](const Args& a) {
            Expect(a, 3, 3, "delegate <account> <delegatee>");
            Address delegatee = AccountOf(a[2]);
            escrow_.Delegate(AccountOf(a[1]), delegatee);
            std::cout << "  votes of " << a[2] << " " << FormatAmount(escrow_.GetVotes(delegatee)) << "\n";
        };
        commands_["attach"] = [this](const Args& a) {
            Expect(a, 2, 2, "attach <id>");
            nodes_.Attach(ParseNumber(a[1]));
        };
        commands_["detach"] = [this](const Args& a) {
            Expect(a, 2, 2, "detach <id>");
            nodes_.Detach(ParseNumber(a[1]));
        };
        commands_["quality"] = [this](const Args& a) {
            Expect(a, 3, 3, "quality <id> <0..10>");
            nodes_.SetQuality(ParseNumber(a[1]), static_cast<int>(ParseNumber(a[2])), clock_.Now());
        };
        commands_["advance"] = [this](const Args& a) {
            Expect(a, 2, 2, "advance <duration>");
            clock_.Advance(ParseDuration(a[1]));
        };
        commands_["power"] = [this](const Args& a) {
            Expect(a, 2, 3, "power <id> [timestamp]");
            std::cout << "  power " << FormatAmount(escrow_.VotingPowerOf(ParseNumber(a[1]), OptionalTime(a, 2)))
                      << "\n";
        };
        commands_["supply"] = [this](const Args& a) {
            Expect(a, 1, 2, "supply [timestamp]");
            std::cout << "  total power " << FormatAmount(escrow_.TotalPowerAt(OptionalTime(a, 1)))
                      << ", locked " << FormatAmount(escrow_.TotalLocked()) << "\n";
        };
        commands_["votes"] = [this](const Args& a) {
            Expect(a, 2, 3, "votes <account> [timestamp]");
            Address account = AccountOf(a[1]);
            Amount votes = a.size() == 3 ? escrow_.GetPastVotes(account, OptionalTime(a, 2))
                                         : escrow_.GetVotes(account);
            std::cout << "  votes " << FormatAmount(votes) << "\n";
        };
        commands_["balance"] = [this](const Args& a) {
            Expect(a, 2, 2, "balance <account>");
            Address account = AccountOf(a[1]);
            std::cout << "  balance " << FormatAmount(token_.BalanceOf(account))
                      << ", positions " << escrow_.BalanceOf(account) << "\n";
        };
        commands_["unclaimed"] = [this](const Args& a) {
            Expect(a, 2, 2, "unclaimed <id>");
            std::cout << "  unclaimed " << FormatAmount(rewards_.Unclaimed(ParseNumber(a[1]))) << "\n";
        };
        commands_["claim"] = [this](const Args& a) {
            Expect(a, 3, 3, "claim <account> <id>");
            Address caller = AccountOf(a[1]);
            rewards_.Claim(caller, ParseNumber(a[2]), caller);
        };
        commands_["compound"] = [this](const Args& a) {
            Expect(a, 3, 3, "compound <account> <id>");
            TokenId id = ParseNumber(a[2]);
            rewards_.CompoundLockRewards(AccountOf(a[1]), id);
            PrintPosition(id);
        };
        commands_["save"] = [this](const Args& a) {
            Expect(a, 1, 1, "save");
            rewards::RewardEngine::State rewardState = rewards_.Export();
            Store().Save(escrow_.Snapshot(), &rewardState);
            std::cout << "  saved to " << db::BackendToString(storeConfig_.backend) << " store\n";
        };
        commands_["load"] = [this](const Args& a) {
            Expect(a, 1, 1, "load");
            escrow::EscrowState state;
            rewards::RewardEngine::State rewardState = rewards_.Export();
            if (!Store().Load(state, &rewardState)) {
                throw PreconditionError(ErrorCode::NotFound, "nothing saved yet");
            }
            escrow_.Restore(std::move(state));
            rewards_.Import(std::move(rewardState));
            std::cout << "  loaded " << escrow_.NextId() - 1 << " minted positions\n";
        };
    }

    db::LedgerStore& Store() {
        if (!store_) {
            store_ = db::LedgerStore::Open(storeConfig_);
        }
        return *store_;
    }

    void PrintPosition(TokenId id) const {
        escrow::LockedBalance locked = escrow_.Locked(id);
        std::cout << "  #" << id << " amount " << FormatAmount(locked.amount)
                  << " end " << locked.end
                  << " power " << FormatAmount(escrow_.BalanceOfNFT(id)) << "\n";
    }

    util::ManualClock clock_;
    asset::TokenLedger token_;
    node::NodeRegistry nodes_;
    Address escrowAddress_;
    Address rewardsAddress_;
    std::shared_ptr<escrow::IFungibleAsset> escrowCustody_;
    std::shared_ptr<escrow::IFungibleAsset> rewardsCustody_;
    escrow::VotingEscrow escrow_;
    rewards::RewardEngine rewards_;
    db::StoreConfig storeConfig_;
    std::unique_ptr<db::LedgerStore> store_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Start-up
// ============================================================================

void SetupLogging(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    util::Logger& logger = util::Logger::Instance();

    if (config.GetBool(keys::PRINTTOCONSOLE, true)) {
        logger.Initialize();
    }
    logger.SetLevel(util::LogLevelFromString(config.GetString(keys::LOGLEVEL, "warn")));
    if (auto debug = config.TryGetString(keys::DEBUG)) {
        logger.ApplyDebugCategories(*debug);
        if (logger.GetLevel() > util::LogLevel::Debug) {
            logger.SetLevel(util::LogLevel::Debug);
        }
    }
}

int AppMain(int argc, char* argv[]) {
    namespace keys = util::ConfigKeys;

    util::ConfigManager config;
    util::ConfigParseResult args = config.ParseCommandLine(argc, argv);
    if (!args.success) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        return 1;
    }
    if (config.HasKey("help") || config.HasKey("h")) {
        PrintHelp();
        return 0;
    }

    std::filesystem::path datadir = config.GetPath(keys::DATADIR, ".");
    std::filesystem::path confPath = config.GetPath(keys::CONF, "");
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        confPath = datadir / util::DEFAULT_CONFIG_FILENAME;
    } else if (confPath.is_relative()) {
        confPath = datadir / confPath;
    }

    if (explicitConf || std::filesystem::exists(confPath)) {
        util::ConfigParseResult result = config.ParseFile(confPath.string());
        if (!result.success) {
            std::cerr << "Error reading " << confPath.string() << ": " << result.errorMessage;
            if (result.errorLine > 0) std::cerr << " (line " << result.errorLine << ")";
            std::cerr << "\n";
            return 1;
        }
        for (const auto& warning : result.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }
    }

    SetupLogging(config);

    Timestamp start = config.GetInt(keys::START_TIME, DEFAULT_START_TIME);
    Simulator sim(config, datadir, start);

    int failures = 0;
    if (auto script = config.TryGetString(keys::SCRIPT)) {
        std::ifstream in(*script);
        if (!in) {
            std::cerr << "Error: cannot open script " << *script << "\n";
            return 1;
        }
        failures = sim.Run(in);
    } else {
        failures = sim.Run(std::cin);
    }

    util::Logger::Instance().Flush();
    return failures == 0 ? 0 : 2;
}

} // namespace
} // namespace veledger

int main(int argc, char* argv[]) {
    try {
        return veledger::AppMain(argc, argv);
    } catch (const veledger::LedgerError& e) {
        std::cerr << "Fatal error(" << veledger::ErrorCodeToString(e.code()) << "): " << e.what()
                  << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
