// COFFER CLI - Command Line Interface
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// The coffer-cli tool drives a pool engine from a command script. It loads
// the pool configuration, optionally restores a saved snapshot, runs one
// command per script line and can write the final state back out.

#include <coffer/core/hex.h>
#include <coffer/governance/pool.h>
#include <coffer/governance/pool_config.h>
#include <coffer/util/config.h>
#include <coffer/util/logging.h>

#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace coffer {
namespace cli {

using governance::OpResult;
using governance::PoolEngine;

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "COFFER CLI";

namespace defaults {
    constexpr const char* CONFIG_FILENAME = "coffer.conf";
    constexpr const char* LOG_LEVEL = "warn";
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string configFile{defaults::CONFIG_FILENAME};
    std::string scriptFile;         // empty reads stdin
    std::string snapshotIn;
    std::string snapshotOut;
    std::string logLevel;           // overrides [log] level

    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: coffer-cli [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Pool config file (default: coffer.conf)\n";
    std::cout << "  -s, --script=FILE          Command script (default: stdin)\n";
    std::cout << "  --snapshot-in=FILE         Restore pool state before running\n";
    std::cout << "  --snapshot-out=FILE        Save pool state after running\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, off\n";
    std::cout << "\nScript commands (one per line, '#' starts a comment):\n";
    std::cout << "  deposit <sender> <amount>\n";
    std::cout << "  submit-action <sender> <target> <value> [hexdata]\n";
    std::cout << "  approve-action <sender> <id>\n";
    std::cout << "  revoke-action <sender> <id>\n";
    std::cout << "  execute-action <sender> <id>\n";
    std::cout << "  submit-proposal <sender> addMember <member>\n";
    std::cout << "  submit-proposal <sender> removeMember <member>\n";
    std::cout << "  submit-proposal <sender> changeParameters <count> <percent> <count|weight>\n";
    std::cout << "  approve-proposal <sender> <id>\n";
    std::cout << "  revoke-proposal <sender> <id>\n";
    std::cout << "  execute-proposal <sender> <id>\n";
    std::cout << "  members | action <id> | proposal <id> | balance | contribution <member>\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 COFFER Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"script", required_argument, nullptr, 's'},
        {"snapshot-in", required_argument, nullptr, 1001},
        {"snapshot-out", required_argument, nullptr, 1002},
        {"loglevel", required_argument, nullptr, 1003},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:s:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 's':
                config.scriptFile = optarg;
                break;
            case 1001:  // --snapshot-in
                config.snapshotIn = optarg;
                break;
            case 1002:  // --snapshot-out
                config.snapshotOut = optarg;
                break;
            case 1003:  // --loglevel
                config.logLevel = optarg;
                break;
            case '?':
            default:
                return false;
        }
    }

    return optind == argc;
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseAmount(const std::string& str, Amount& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }
    Amount value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        if (!CheckedMul(value, 10, value) ||
            !CheckedAdd(value, static_cast<Amount>(c - '0'), value)) {
            return false;
        }
    }
    out = value;
    return true;
}

std::vector<std::string> Tokenize(const std::string& line) {
    std::istringstream in(line);
    return std::vector<std::string>(std::istream_iterator<std::string>(in),
                                    std::istream_iterator<std::string>());
}

// ============================================================================
// Script Runner
// ============================================================================

/**
 * Executes script lines against one engine and prints results to stdout.
 */
class ScriptRunner {
public:
    explicit ScriptRunner(PoolEngine& engine) : engine_(engine) {}

    /// Run a line; false on a syntax error or failed command
    bool RunLine(const std::string& line, int lineNum);

private:
    bool Usage(int lineNum, const std::string& message) {
        std::cout << "line " << lineNum << ": " << message << "\n";
        return false;
    }

    bool Report(const OpResult& result) {
        if (result) {
            std::cout << "ok\n";
            return true;
        }
        std::cout << "error " << governance::GovernanceErrorToString(result.error)
                  << ": " << result.message << "\n";
        return false;
    }

    bool Report(const governance::SubmitResult& result) {
        if (result) {
            std::cout << "id " << result.id << "\n";
            return true;
        }
        std::cout << "error " << governance::GovernanceErrorToString(result.error)
                  << ": " << result.message << "\n";
        return false;
    }

    void PrintApprovals(const governance::ApprovalState& approvals) {
        std::cout << " approvals=" << approvals.count
                  << " weight=" << FormatAmount(approvals.weight);
        for (const auto& [voter, captured] : approvals.approvedBy) {
            std::cout << "\n  approved-by " << FormatAddress(voter) << " " << FormatAmount(captured);
        }
        std::cout << "\n";
    }

    PoolEngine& engine_;
};

bool ScriptRunner::RunLine(const std::string& line, int lineNum) {
    auto args = Tokenize(line.substr(0, line.find('#')));
    if (args.empty()) {
        return true;
    }
    const std::string& cmd = args[0];

    // Queries
    if (cmd == "members") {
        for (const auto& member : engine_.GetMembers()) {
            std::cout << FormatAddress(member) << "\n";
        }
        return true;
    }
    if (cmd == "balance") {
        std::cout << FormatAmount(engine_.GetBalance()) << "\n";
        return true;
    }
    if (cmd == "contribution") {
        auto member = args.size() == 2 ? ParseAddress(args[1]) : std::nullopt;
        if (!member) {
            return Usage(lineNum, "usage: contribution <member>");
        }
        std::cout << FormatAmount(engine_.ContributionOf(*member)) << "\n";
        return true;
    }

    RecordId id;
    if (cmd == "action" || cmd == "proposal") {
        if (args.size() != 2 || !ParseAmount(args[1], id)) {
            return Usage(lineNum, "usage: " + cmd + " <id>");
        }
        if (cmd == "action") {
            auto action = engine_.GetAction(id);
            if (!action) {
                return Usage(lineNum, "no action " + args[1]);
            }
            std::cout << "action " << id << " " << action->payload.ToString()
                      << " executed=" << (action->executed ? "true" : "false");
            PrintApprovals(action->approvals);
        } else {
            auto proposal = engine_.GetProposal(id);
            if (!proposal) {
                return Usage(lineNum, "no proposal " + args[1]);
            }
            std::cout << "proposal " << id << " " << governance::DescribeProposal(proposal->payload)
                      << " executed=" << (proposal->executed ? "true" : "false");
            PrintApprovals(proposal->approvals);
        }
        return true;
    }

    // Commands: all take a sender
    if (args.size() < 2) {
        return Usage(lineNum, "unknown or incomplete command: " + cmd);
    }
    auto sender = ParseAddress(args[1]);
    if (!sender) {
        return Usage(lineNum, "invalid sender address: " + args[1]);
    }

    if (cmd == "deposit") {
        Amount amount;
        if (args.size() != 3 || !ParseAmount(args[2], amount)) {
            return Usage(lineNum, "usage: deposit <sender> <amount>");
        }
        return Report(engine_.Deposit(*sender, amount));
    }

    if (cmd == "submit-action") {
        Amount value;
        std::optional<Address> target;
        if (args.size() >= 4) {
            target = ParseAddress(args[2]);
        }
        if (!target || args.size() > 5 || !ParseAmount(args[3], value)) {
            return Usage(lineNum, "usage: submit-action <sender> <target> <value> [hexdata]");
        }
        std::vector<Byte> data;
        if (args.size() == 5) {
            try {
                data = HexToBytes(args[4]);
            } catch (const std::invalid_argument& e) {
                return Usage(lineNum, std::string("invalid hex data: ") + e.what());
            }
        }
        return Report(engine_.SubmitAction(*sender, *target, value, data));
    }

    if (cmd == "submit-proposal") {
        auto kind = args.size() >= 3 ? governance::ParseProposalKind(args[2]) : std::nullopt;
        if (!kind) {
            return Usage(lineNum, "usage: submit-proposal <sender> <addMember|removeMember|changeParameters> ...");
        }
        governance::ProposalPayload payload;
        if (*kind == governance::ProposalKind::ChangeParameters) {
            governance::ChangeParametersChange change;
            std::optional<governance::QuorumMode> mode;
            if (args.size() == 6) {
                mode = governance::ParseQuorumMode(args[5]);
            }
            if (!mode || !ParseAmount(args[3], change.config.countThreshold) ||
                !ParseAmount(args[4], change.config.weightThresholdPercent)) {
                return Usage(lineNum, "usage: submit-proposal <sender> changeParameters <count> <percent> <count|weight>");
            }
            change.config.mode = *mode;
            payload = change;
        } else {
            auto member = args.size() == 4 ? ParseAddress(args[3]) : std::nullopt;
            if (!member) {
                return Usage(lineNum, "usage: submit-proposal <sender> " + args[2] + " <member>");
            }
            if (*kind == governance::ProposalKind::AddMember) {
                payload = governance::AddMemberChange{*member};
            } else {
                payload = governance::RemoveMemberChange{*member};
            }
        }
        return Report(engine_.SubmitProposal(*sender, payload));
    }

    // Remaining commands are <cmd> <sender> <id>
    if (args.size() != 3 || !ParseAmount(args[2], id)) {
        return Usage(lineNum, "usage: " + cmd + " <sender> <id>");
    }
    if (cmd == "approve-action") return Report(engine_.ApproveAction(*sender, id));
    if (cmd == "revoke-action") return Report(engine_.RevokeApproval(*sender, id));
    if (cmd == "execute-action") return Report(engine_.ExecuteAction(*sender, id));
    if (cmd == "approve-proposal") return Report(engine_.ApproveProposal(*sender, id));
    if (cmd == "revoke-proposal") return Report(engine_.RevokeProposalApproval(*sender, id));
    if (cmd == "execute-proposal") return Report(engine_.ExecuteProposal(*sender, id));

    return Usage(lineNum, "unknown command: " + cmd);
}

// ============================================================================
// Snapshot Files
// ============================================================================

bool ReadFileBytes(const std::string& path, std::vector<Byte>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool WriteFileBytes(const std::string& path, const std::vector<Byte>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }
    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }

    util::ConfigManager confManager;
    confManager.SetDefault("level", defaults::LOG_LEVEL, governance::LOG_SECTION);
    auto parsed = confManager.ParseFile(config.configFile);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage;
        if (parsed.errorLine > 0) {
            std::cerr << " (" << parsed.errorFile << ":" << parsed.errorLine << ")";
        }
        std::cerr << "\n";
        return 1;
    }
    if (!config.logLevel.empty()) {
        confManager.Set("level", config.logLevel, governance::LOG_SECTION);
    }

    governance::LogSettings logSettings;
    auto result = governance::LoadLogSettings(confManager, logSettings);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }
    util::Logger::Instance().Initialize(logSettings.level);
    governance::ApplyLogSettings(logSettings);

    governance::PoolConfig poolConfig;
    result = governance::LoadPoolConfig(confManager, poolConfig);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    auto effect = std::make_shared<governance::LoggingPayoutEffect>();
    auto engine = PoolEngine::Create(poolConfig, effect, &result);
    if (!engine) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    if (!config.snapshotIn.empty()) {
        std::vector<Byte> snapshot;
        if (!ReadFileBytes(config.snapshotIn, snapshot)) {
            std::cerr << "Error: cannot read snapshot " << config.snapshotIn << "\n";
            return 1;
        }
        result = engine->Restore(snapshot);
        if (!result) {
            std::cerr << "Error: " << result.message << "\n";
            return 1;
        }
    }

    std::ifstream scriptFile;
    if (!config.scriptFile.empty()) {
        scriptFile.open(config.scriptFile);
        if (!scriptFile) {
            std::cerr << "Error: cannot open script " << config.scriptFile << "\n";
            return 1;
        }
    }
    std::istream& script = config.scriptFile.empty() ? std::cin : scriptFile;

    ScriptRunner runner(*engine);
    std::string line;
    int lineNum = 0;
    int failures = 0;
    while (std::getline(script, line)) {
        ++lineNum;
        if (!runner.RunLine(line, lineNum)) {
            ++failures;
        }
    }
    LogInfoF(util::LogCategory::CLI, "Ran %d lines, %d failed, %zu payouts",
             lineNum, failures, effect->PayoutCount());

    if (!config.snapshotOut.empty() && !WriteFileBytes(config.snapshotOut, engine->Serialize())) {
        LogErrorF(util::LogCategory::SNAPSHOT, "Cannot write snapshot %s", config.snapshotOut.c_str());
        std::cerr << "Error: cannot write snapshot " << config.snapshotOut << "\n";
        return 1;
    }

    util::Logger::Instance().Shutdown();
    return failures == 0 ? 0 : 2;
}

} // namespace cli
} // namespace coffer

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return coffer::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
