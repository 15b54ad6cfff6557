// RELIQUARY CLI - Command Line Interface
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// reliquary-cli opens the governance ledger in the data directory and runs
// one operation per invocation.

#include "reliquary/db/database.h"
#include "reliquary/governance/engine.h"
#include "reliquary/util/config.h"
#include "reliquary/util/logging.h"
#include "reliquary/util/time.h"

#include <cerrno>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace reliquary {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "RELIQUARY CLI";

constexpr const char* CALLER_KEY = "caller";
constexpr const char* LEDGER_DIRNAME = "ledger";

using governance::GovernanceEngine;
using governance::Status;

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: reliquary-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -datadir=DIR               Data directory path\n";
    std::cout << "  -caller=ID                 Identity performing the operation\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, fatal, none\n";
    std::cout << "  -logfile=FILE              Also write the log to FILE\n";
    std::cout << "  -noprinttoconsole          Do not log to the console\n";
    std::cout << "  -governance.KEY=VALUE      Override a [governance] setting\n";
    std::cout << "\n== Agents ==\n";
    std::cout << "registeragent <id> <type> <power> [pubkey]\n";
    std::cout << "deactivateagent <id>\n";
    std::cout << "getagent <id>\n";
    std::cout << "listagents\n";
    std::cout << "\n== Proposals ==\n";
    std::cout << "createproposal <type> <contenthash>\n";
    std::cout << "vote <proposalid> <yes|no>\n";
    std::cout << "execute <proposalid>\n";
    std::cout << "cancel <proposalid>\n";
    std::cout << "getproposal <proposalid>\n";
    std::cout << "listproposals\n";
    std::cout << "\n== Decisions ==\n";
    std::cout << "recorddecision <requestid> <type> <decision> <confidence> [agent,...] [proofhash]\n";
    std::cout << "verifydecision <requestid>\n";
    std::cout << "\n== Administration ==\n";
    std::cout << "pause\n";
    std::cout << "unpause\n";
    std::cout << "status\n";
    std::cout << "\nSample configuration:\n\n" << util::ConfigManager::GenerateSampleConfig();
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " version " << VERSION << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseUint(const std::string& str, uint64_t* out) {
    if (str.empty() || str[0] == '-' || str[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str.c_str(), &end, 10);
    if (errno != 0 || end == str.c_str() || *end != '\0') {
        return false;
    }
    *out = static_cast<uint64_t>(value);
    return true;
}

bool ParseDouble(const std::string& str, double* out) {
    if (str.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(str.c_str(), &end);
    if (errno != 0 || end == str.c_str() || *end != '\0') {
        return false;
    }
    *out = value;
    return true;
}

bool ParseSupport(const std::string& str, bool* out) {
    if (str == "yes" || str == "true" || str == "1") {
        *out = true;
        return true;
    }
    if (str == "no" || str == "false" || str == "0") {
        *out = false;
        return true;
    }
    return false;
}

std::vector<std::string> SplitList(const std::string& str) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// ============================================================================
// Output
// ============================================================================

void PrintAgent(const governance::Agent& agent) {
    std::cout << "id:          " << agent.id << "\n";
    std::cout << "type:        " << agent.agentType << "\n";
    std::cout << "votingpower: " << agent.votingPower << "\n";
    std::cout << "active:      " << (agent.active ? "true" : "false") << "\n";
    std::cout << "publickey:   " << agent.publicKey << "\n";
    std::cout << "registered:  " << util::FormatISO8601(agent.registeredAt) << "\n";
}

void PrintProposal(const governance::Proposal& p, governance::ProposalStatus status) {
    std::cout << "id:          " << p.id << "\n";
    std::cout << "status:      " << governance::ProposalStatusToString(status) << "\n";
    std::cout << "type:        " << p.proposalType << "\n";
    std::cout << "proposer:    " << p.proposer << "\n";
    std::cout << "contenthash: " << p.contentHash << "\n";
    std::cout << "votingstart: " << util::FormatISO8601(p.votingStart) << "\n";
    std::cout << "votingend:   " << util::FormatISO8601(p.votingEnd) << "\n";
    std::cout << "executable:  " << util::FormatISO8601(p.ExecutableAt()) << "\n";
    std::cout << "yes:         " << p.yesVotes << "\n";
    std::cout << "no:          " << p.noVotes << "\n";
}

// ============================================================================
// Commands
// ============================================================================

struct CommandContext {
    GovernanceEngine& engine;
    std::string caller;
    std::vector<std::string> args;
};

using CommandFunc = std::function<Status(CommandContext&)>;

struct Command {
    size_t minArgs;
    size_t maxArgs;
    CommandFunc func;
};

Status BadArgument(const std::string& what) {
    return Status::InvalidArgument(what);
}

Status CmdRegisterAgent(CommandContext& ctx) {
    uint64_t power = 0;
    if (!ParseUint(ctx.args[2], &power)) {
        return BadArgument("voting power must be a positive integer: " + ctx.args[2]);
    }
    std::string pubkey = ctx.args.size() > 3 ? ctx.args[3] : "";
    Status s = ctx.engine.RegisterAgent(ctx.caller, ctx.args[0], ctx.args[1], power, pubkey);
    if (s.ok()) {
        std::cout << "registered " << ctx.args[0] << "\n";
    }
    return s;
}

Status CmdDeactivateAgent(CommandContext& ctx) {
    Status s = ctx.engine.DeactivateAgent(ctx.caller, ctx.args[0]);
    if (s.ok()) {
        std::cout << "deactivated " << ctx.args[0] << "\n";
    }
    return s;
}

Status CmdGetAgent(CommandContext& ctx) {
    auto agent = ctx.engine.FindAgent(ctx.args[0]);
    if (!agent) {
        return Status::NotFound("agent " + ctx.args[0]);
    }
    PrintAgent(*agent);
    return Status::Ok();
}

Status CmdListAgents(CommandContext& ctx) {
    for (const auto& agent : ctx.engine.ListAgents()) {
        std::cout << agent.ToString() << "\n";
    }
    return Status::Ok();
}

Status CmdCreateProposal(CommandContext& ctx) {
    ProposalId id = 0;
    Status s = ctx.engine.CreateProposal(ctx.caller, ctx.args[0], ctx.args[1], &id);
    if (s.ok()) {
        std::cout << id << "\n";
    }
    return s;
}

Status CmdVote(CommandContext& ctx) {
    uint64_t id = 0;
    if (!ParseUint(ctx.args[0], &id)) {
        return BadArgument("invalid proposal id: " + ctx.args[0]);
    }
    bool support = false;
    if (!ParseSupport(ctx.args[1], &support)) {
        return BadArgument("vote must be yes or no: " + ctx.args[1]);
    }
    return ctx.engine.Vote(ctx.caller, id, support);
}

Status CmdExecute(CommandContext& ctx) {
    uint64_t id = 0;
    if (!ParseUint(ctx.args[0], &id)) {
        return BadArgument("invalid proposal id: " + ctx.args[0]);
    }
    bool success = false;
    Status s = ctx.engine.ExecuteProposal(ctx.caller, id, &success);
    if (s.ok()) {
        std::cout << "executed, handler " << (success ? "succeeded" : "had no effect") << "\n";
    }
    return s;
}

Status CmdCancel(CommandContext& ctx) {
    uint64_t id = 0;
    if (!ParseUint(ctx.args[0], &id)) {
        return BadArgument("invalid proposal id: " + ctx.args[0]);
    }
    return ctx.engine.CancelProposal(ctx.caller, id);
}

Status CmdGetProposal(CommandContext& ctx) {
    uint64_t id = 0;
    if (!ParseUint(ctx.args[0], &id)) {
        return BadArgument("invalid proposal id: " + ctx.args[0]);
    }
    auto proposal = ctx.engine.FindProposal(id);
    if (!proposal) {
        return Status::NotFound("proposal " + ctx.args[0]);
    }
    governance::ProposalStatus status;
    Status s = ctx.engine.GetProposalStatus(id, &status);
    if (!s.ok()) {
        return s;
    }
    PrintProposal(*proposal, status);
    for (const auto& entry : ctx.engine.GetVotes(id)) {
        std::cout << "vote:        " << entry.first << " "
                  << (entry.second.support ? "yes" : "no")
                  << " (" << entry.second.weight << ")\n";
    }
    return Status::Ok();
}

Status CmdListProposals(CommandContext& ctx) {
    for (const auto& proposal : ctx.engine.ListProposals()) {
        std::cout << proposal.ToString() << "\n";
    }
    return Status::Ok();
}

Status CmdRecordDecision(CommandContext& ctx) {
    governance::DecisionSubmission submission;
    submission.requestId = ctx.args[0];
    submission.decisionType = ctx.args[1];
    submission.finalDecision = ctx.args[2];
    if (!ParseDouble(ctx.args[3], &submission.confidence)) {
        return BadArgument("invalid confidence: " + ctx.args[3]);
    }
    if (ctx.args.size() > 4) {
        submission.participatingAgents = SplitList(ctx.args[4]);
    }
    if (ctx.args.size() > 5) {
        submission.proofHash = ctx.args[5];
    }
    
    Status s = ctx.engine.RecordDecision(ctx.caller, submission);
    if (s.ok()) {
        auto decision = ctx.engine.GetDecision(submission.requestId);
        if (decision) {
            std::cout << decision->digest.ToHex() << "\n";
        }
    }
    return s;
}

Status CmdVerifyDecision(CommandContext& ctx) {
    governance::DecisionVerification v = ctx.engine.VerifyDecision(ctx.args[0]);
    std::cout << "valid:       " << (v.isValid ? "true" : "false") << "\n";
    std::cout << "decision:    " << v.decision << "\n";
    std::cout << "confidence:  " << v.confidence << "\n";
    return Status::Ok();
}

Status CmdPause(CommandContext& ctx) {
    return ctx.engine.Pause(ctx.caller);
}

Status CmdUnpause(CommandContext& ctx) {
    return ctx.engine.Unpause(ctx.caller);
}

Status CmdStatus(CommandContext& ctx) {
    governance::GovernanceSummary summary = ctx.engine.GetSummary();
    const governance::GovernanceParams& params = ctx.engine.GetParams();
    std::cout << "admin:          " << params.admin << "\n";
    std::cout << "votingperiod:   " << util::FormatDuration(params.votingPeriod) << "\n";
    std::cout << "executiondelay: " << util::FormatDuration(params.executionDelay) << "\n";
    std::cout << "quorum:         " << params.quorumThreshold << "\n";
    std::cout << "paused:         " << (summary.paused ? "true" : "false") << "\n";
    std::cout << "agents:         " << summary.activeAgents << " active of "
              << summary.totalAgents << "\n";
    std::cout << "votingpower:    " << summary.activeVotingPower << "\n";
    std::cout << "proposals:      " << summary.totalProposals << " ("
              << summary.votingProposals << " voting, "
              << summary.executedProposals << " executed)\n";
    std::cout << "decisions:      " << summary.decisions << "\n";
    return Status::Ok();
}

const std::map<std::string, Command>& GetCommands() {
    static const std::map<std::string, Command> commands = {
        {"registeragent",   {3, 4, CmdRegisterAgent}},
        {"deactivateagent", {1, 1, CmdDeactivateAgent}},
        {"getagent",        {1, 1, CmdGetAgent}},
        {"listagents",      {0, 0, CmdListAgents}},
        {"createproposal",  {2, 2, CmdCreateProposal}},
        {"vote",            {2, 2, CmdVote}},
        {"execute",         {1, 1, CmdExecute}},
        {"cancel",          {1, 1, CmdCancel}},
        {"getproposal",     {1, 1, CmdGetProposal}},
        {"listproposals",   {0, 0, CmdListProposals}},
        {"recorddecision",  {4, 6, CmdRecordDecision}},
        {"verifydecision",  {1, 1, CmdVerifyDecision}},
        {"pause",           {0, 0, CmdPause}},
        {"unpause",         {0, 0, CmdUnpause}},
        {"status",          {0, 0, CmdStatus}},
    };
    return commands;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    
    util::ConfigParseResult result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        std::cerr << "Use 'reliquary-cli -help' for usage information.\n";
        return 1;
    }
    
    if (config.GetBool("help", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    
    const std::vector<std::string>& positional = config.GetPositionalArgs();
    if (positional.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'reliquary-cli -help' for usage information.\n";
        return 1;
    }
    
    const std::string& name = positional[0];
    auto cmd = GetCommands().find(name);
    if (cmd == GetCommands().end()) {
        std::cerr << "Error: Unknown command '" << name << "'\n";
        return 1;
    }
    
    std::vector<std::string> args(positional.begin() + 1, positional.end());
    if (args.size() < cmd->second.minArgs || args.size() > cmd->second.maxArgs) {
        std::cerr << "Error: Wrong number of parameters for '" << name << "'\n";
        return 1;
    }
    
    result = config.LoadConfigFile();
    if (!result.success) {
        std::cerr << "Error reading config: " << result.ToString() << "\n";
        return 1;
    }
    
    util::LogOptions logOptions;
    logOptions.level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    logOptions.logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    logOptions.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    util::SetupLogging(logOptions);
    
    governance::GovernanceParams params;
    Status s = governance::GovernanceParams::FromConfig(config, &params);
    if (!s.ok()) {
        std::cerr << "Error: " << s.ToString() << "\n";
        return 1;
    }
    
    db::Options dbOptions;
    dbOptions.create_if_missing = true;
    auto opened = db::OpenDatabase(config.GetDataDir() + "/" + LEDGER_DIRNAME, dbOptions);
    if (!opened.first.ok()) {
        std::cerr << "Error: cannot open ledger: " << opened.first.ToString() << "\n";
        return 1;
    }
    
    std::unique_ptr<GovernanceEngine> engine;
    s = GovernanceEngine::Open(params, std::make_shared<util::SystemClock>(),
                               std::move(opened.second), &engine);
    if (!s.ok()) {
        std::cerr << "Error: " << s.ToString() << "\n";
        return 1;
    }
    
    CommandContext ctx{*engine, config.GetString(CALLER_KEY, ""), std::move(args)};
    s = cmd->second.func(ctx);
    
    util::Logger::Instance().Flush();
    
    if (!s.ok()) {
        std::cerr << "Error: " << s.ToString() << "\n";
        return 2;
    }
    return 0;
}

} // namespace cli
} // namespace reliquary

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return reliquary::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
