#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"
#include "MigrationService.hpp"
#include "ReportJson.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <QCoreApplication>
#include <QString>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


namespace {

std::atomic<bool> g_stop_requested{false};

void handle_interrupt(int)
{
    g_stop_requested.store(true);
}

constexpr int kExitUsage = 2;

const char* kUsage =
    "Usage: ordne-migrate [--db PATH] <command> [options]\n"
    "\n"
    "Commands:\n"
    "  list [--status STATUS]\n"
    "  status <plan-id>\n"
    "  create --action move|copy|delete|hardlink|symlink\n"
    "         (--files ID,ID,... | --category NAME [--drive ID] [--priority P] | --group ID)\n"
    "         [--target DRIVE-ID] [--subdir PATH] [--max-batch-bytes N] [--description TEXT]\n"
    "  approve <plan-id>\n"
    "  execute <plan-id> [--dry-run] [--batch-size N] [--io-limit KIBPS]\n"
    "         [--policy abort|skip|prompt] [--retries N]\n"
    "  rollback <plan-id> [--step STEP-ID] [--reason TEXT]\n"
    "  abort <plan-id> [--reason TEXT]\n"
    "\n"
    "Common options: --human (record actions as human-approved)\n";

struct ParsedArguments {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool dry_run{false};
    bool human{false};
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--dry-run") {
            parsed.dry_run = true;
        } else if (arg == "--human") {
            parsed.human = true;
        } else if (arg == "--help" || arg == "-h") {
            parsed.command = "help";
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw UsageError("missing value for " + arg);
            }
            parsed.options[arg.substr(2)] = argv[++i];
        } else if (parsed.command.empty()) {
            parsed.command = arg;
        } else {
            parsed.positional.push_back(arg);
        }
    }
    return parsed;
}

std::optional<std::string> option(const ParsedArguments& args, const std::string& name)
{
    auto it = args.options.find(name);
    if (it == args.options.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::int64_t require_int(const std::string& value, const std::string& what)
{
    auto parsed = Utils::parse_int64(value);
    if (!parsed || *parsed < 0) {
        throw UsageError("invalid " + what + ": '" + value + "'");
    }
    return *parsed;
}

std::optional<std::int64_t> optional_int(const ParsedArguments& args, const std::string& name)
{
    if (auto value = option(args, name)) {
        return require_int(*value, "--" + name);
    }
    return std::nullopt;
}

std::int64_t plan_argument(const ParsedArguments& args)
{
    if (args.positional.empty()) {
        throw UsageError(args.command + " needs a plan id");
    }
    return require_int(args.positional.front(), "plan id");
}

AgentMode agent_mode(const ParsedArguments& args)
{
    return args.human ? AgentMode::HumanApproved : AgentMode::Automatic;
}

Json::Value run_create(MigrationService& service, const ParsedArguments& args)
{
    const auto action_value = option(args, "action");
    if (!action_value) {
        throw UsageError("create needs --action");
    }
    const auto action = parse_step_action(*action_value);
    if (!action) {
        throw UsageError("unknown action '" + *action_value + "'");
    }

    Selection selection;
    if (auto files = option(args, "files")) {
        try {
            selection = Selection::files(Utils::parse_id_list(*files));
        } catch (const std::invalid_argument& ex) {
            throw UsageError(std::string("invalid --files: ") + ex.what());
        }
    } else if (auto category = option(args, "category")) {
        std::optional<FilePriority> priority;
        if (auto value = option(args, "priority")) {
            priority = parse_file_priority(*value);
            if (!priority) {
                throw UsageError("unknown priority '" + *value + "'");
            }
        }
        selection = Selection::by_category(*category, optional_int(args, "drive"), priority);
    } else if (auto group = optional_int(args, "group")) {
        selection = Selection::group(*group);
    } else {
        throw UsageError("create needs --files, --category or --group");
    }

    PlannerOptions options;
    options.target_drive_id = optional_int(args, "target");
    options.max_batch_size_bytes = optional_int(args, "max-batch-bytes");
    options.description = option(args, "description").value_or("");
    options.dest_subdir = option(args, "subdir").value_or("");
    options.agent_mode = agent_mode(args);

    const auto plan_id = service.create_plan(selection, *action, options);
    return ReportJson::to_json(service.plan_status(plan_id));
}

Json::Value run_execute(MigrationService& service, const ParsedArguments& args)
{
    auto options = service.default_execute_options();
    options.mode = args.dry_run ? ExecutionMode::DryRun : ExecutionMode::Execute;
    options.agent_mode = agent_mode(args);
    options.stop_flag = &g_stop_requested;
    if (auto batch = optional_int(args, "batch-size")) {
        options.batch_size = static_cast<std::size_t>(*batch);
    }
    if (auto limit = optional_int(args, "io-limit")) {
        options.io_limit_kibps = static_cast<std::uint64_t>(*limit);
    }
    if (auto policy = option(args, "policy")) {
        auto mode = parse_failure_mode(*policy);
        if (!mode) {
            throw UsageError("unknown policy '" + *policy + "'");
        }
        options.failure_policy.mode = *mode;
    }
    if (auto retries = optional_int(args, "retries")) {
        options.failure_policy.retries = static_cast<int>(*retries);
    }
    options.on_progress = [](const ProgressEvent& event) {
        std::fprintf(stderr, "[%lld/%lld] step %lld %s %s\n",
                     static_cast<long long>(event.completed_files),
                     static_cast<long long>(event.total_files),
                     static_cast<long long>(event.step_id),
                     to_string(event.action), to_string(event.status));
    };

    return ReportJson::to_json(service.execute_plan(plan_argument(args), options));
}

Json::Value run_command(MigrationService& service, const ParsedArguments& args)
{
    if (args.command == "list") {
        std::optional<PlanStatus> status;
        if (auto value = option(args, "status")) {
            status = parse_plan_status(*value);
            if (!status) {
                throw UsageError("unknown status '" + *value + "'");
            }
        }
        Json::Value plans(Json::arrayValue);
        for (const auto& plan : service.list_plans(status)) {
            plans.append(ReportJson::to_json(plan));
        }
        return plans;
    }
    if (args.command == "status") {
        return ReportJson::to_json(service.plan_status(plan_argument(args)));
    }
    if (args.command == "create") {
        return run_create(service, args);
    }
    if (args.command == "approve") {
        return ReportJson::to_json(service.approve_plan(plan_argument(args), agent_mode(args)));
    }
    if (args.command == "execute") {
        return run_execute(service, args);
    }
    if (args.command == "rollback") {
        RollbackOptions options;
        options.agent_mode = agent_mode(args);
        options.reason = option(args, "reason").value_or("requested from command line");
        return ReportJson::to_json(service.rollback(plan_argument(args), optional_int(args, "step"), options));
    }
    if (args.command == "abort") {
        return ReportJson::to_json(service.abort_plan(plan_argument(args),
                                                      option(args, "reason").value_or("aborted from command line"),
                                                      agent_mode(args)));
    }
    throw UsageError("unknown command '" + args.command + "'");
}

bool initialize_loggers(const Settings& settings)
{
    try {
        Logger::setup_loggers(settings.get_log_dir(),
                              Logger::parse_level(settings.get_log_level(), spdlog::level::info));
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

} // namespace


int main(int argc, char** argv)
{
    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const UsageError& ex) {
        std::fprintf(stderr, "%s\n\n%s", ex.what(), kUsage);
        return kExitUsage;
    }
    if (args.command.empty() || args.command == "help") {
        std::fputs(kUsage, args.command.empty() ? stderr : stdout);
        return args.command.empty() ? kExitUsage : EXIT_SUCCESS;
    }

    QCoreApplication::setApplicationName(QStringLiteral("ordne"));
    QCoreApplication app(argc, argv);

    Settings settings;
    settings.load();
    if (!initialize_loggers(settings)) {
        return EXIT_FAILURE;
    }
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    try {
        DatabaseManager db(option(args, "db").value_or(settings.get_database_path()));
        MigrationService service(settings, db);
        std::cout << ReportJson::write(run_command(service, args)) << std::endl;
        return EXIT_SUCCESS;
    } catch (const UsageError& ex) {
        std::fprintf(stderr, "%s\n\n%s", ex.what(), kUsage);
        return kExitUsage;
    } catch (const ErrorCodes::EngineException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.get_full_details());
        }
        std::cout << ReportJson::write(ReportJson::error_to_json(ex)) << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
