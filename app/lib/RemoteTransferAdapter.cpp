#include "RemoteTransferAdapter.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"

#ifdef __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <sstream>

using ErrorCodes::Code;

namespace {
// rclone exit codes for "directory not found" and "file not found"
constexpr int kRcloneDirNotFound = 3;
constexpr int kRcloneFileNotFound = 4;

std::uint64_t json_bytes(const Json::Value& value)
{
    if (value.isUInt64()) {
        return value.asUInt64();
    }
    if (value.isNumeric() && value.asDouble() > 0) {
        return static_cast<std::uint64_t>(value.asDouble());
    }
    return 0;
}
}


RemoteTransferAdapter::RemoteTransferAdapter(std::string remote,
                                             std::string rclone_path,
                                             std::chrono::seconds query_timeout,
                                             std::chrono::seconds hash_timeout)
    : remote_(std::move(remote)),
      rclone_path_(std::move(rclone_path)),
      query_timeout_(query_timeout),
      hash_timeout_(hash_timeout),
      logger_(Logger::get_logger("transfer_logger"))
{
}


ProcessResult RemoteTransferAdapter::run(const std::vector<std::string>& argv, std::chrono::seconds timeout) const
{
    return runner_.run(argv, timeout, {}, [this] { beat(); });
}


std::string RemoteTransferAdapter::object_spec(const std::string& remote, const std::string& path)
{
    std::string spec = remote;
    if (spec.empty() || spec.back() != ':') {
        spec.push_back(':');
    }
    std::size_t start = 0;
    while (start < path.size() && path[start] == '/') {
        ++start;
    }
    return spec + path.substr(start);
}


std::vector<std::string> RemoteTransferAdapter::copy_args(const std::string& from,
                                                          const std::string& to,
                                                          const TransferOptions& options) const
{
    std::vector<std::string> args{rclone_path_, "copyto"};
    if (options.checksum) {
        args.emplace_back("--checksum");
    }
    if (options.preserve_attributes) {
        args.emplace_back("--metadata");
    }
    if (options.io_limit_kibps > 0) {
        args.emplace_back("--bwlimit");
        args.emplace_back(std::to_string(options.io_limit_kibps) + "K");
    }
    args.emplace_back("--transfers");
    args.emplace_back("4");
    args.emplace_back("--checkers");
    args.emplace_back("8");
    args.push_back(from);
    args.push_back(to);
    return args;
}


TransferResult RemoteTransferAdapter::remote_copy(const std::string& source,
                                                  const std::string& destination,
                                                  const std::string& remote,
                                                  const TransferOptions& options)
{
    const std::string target = object_spec(remote, destination);
    if (logger_) {
        logger_->info("rclone copy '{}' -> '{}'", source, target);
    }

    const auto result = run(copy_args(source, target, options), options.timeout);
    TransferResult transfer_result;
    if (!result.succeeded()) {
        transfer_result.timed_out = result.timed_out;
        transfer_result.message = result.timed_out
            ? "rclone timed out"
            : "rclone exited with " + std::to_string(result.exit_code) + ": " + result.stderr_text;
        return transfer_result;
    }
    transfer_result.outcome = options.checksum ? TransferOutcome::CompletedVerified
                                               : TransferOutcome::Completed;
    return transfer_result;
}


TransferResult RemoteTransferAdapter::transfer(const std::string& source,
                                               const std::string& destination,
                                               const TransferOptions& options)
{
    return remote_copy(source, destination, remote_, options);
}


TransferResult RemoteTransferAdapter::restore(const std::string& destination,
                                              const std::string& source,
                                              const TransferOptions& options)
{
    const std::string from = object_spec(remote_, destination);
    const auto result = run(copy_args(from, source, options), options.timeout);
    TransferResult transfer_result;
    if (!result.succeeded()) {
        transfer_result.timed_out = result.timed_out;
        transfer_result.message = result.timed_out ? "rclone timed out" : result.stderr_text;
        return transfer_result;
    }
    transfer_result.outcome = TransferOutcome::Completed;
    return transfer_result;
}


TransferResult RemoteTransferAdapter::link(const std::string&, const std::string& destination, bool)
{
    TransferResult result;
    result.message = "links are not supported on rclone remote " + remote_ + " (" + destination + ")";
    return result;
}


bool RemoteTransferAdapter::exists(const std::string& path)
{
    const auto result = run({rclone_path_, "lsjson", object_spec(remote_, path)},
                                    query_timeout_);
    if (result.exit_code == kRcloneDirNotFound || result.exit_code == kRcloneFileNotFound) {
        return false;
    }
    if (!result.succeeded()) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED,
                           "rclone lsjson " + path + " failed: " + result.stderr_text);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(result.stdout_text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED, "Unparseable rclone lsjson output: " + errors);
    }
    return root.isArray() && !root.empty();
}


void RemoteTransferAdapter::remove(const std::string& path)
{
    const auto result = run({rclone_path_, "deletefile", object_spec(remote_, path)},
                                    query_timeout_);
    if (!result.succeeded()) {
        THROW_ENGINE_ERROR(Code::TRANSFER_FAILED,
                           "rclone deletefile " + path + " failed: " + result.stderr_text);
    }
}


void RemoteTransferAdapter::prepare_destination(const std::string&)
{
    // rclone creates intermediate directories on upload
}


std::string RemoteTransferAdapter::compute_hash(const std::string& path, HashAlgorithm algorithm)
{
    return ContentHasher::compute_remote_hash(runner_, rclone_path_, object_spec(remote_, path),
                                              algorithm, hash_timeout_, [this] { beat(); });
}


std::optional<SpaceInfo> RemoteTransferAdapter::space()
{
    const auto result = run({rclone_path_, "about", "--json", object_spec(remote_, "")},
                                    query_timeout_);
    if (!result.succeeded()) {
        if (logger_) {
            logger_->warn("rclone about failed for '{}': {}", remote_, result.stderr_text);
        }
        return std::nullopt;
    }
    return parse_about_json(result.stdout_text);
}


std::optional<SpaceInfo> RemoteTransferAdapter::parse_about_json(const std::string& json)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json);
    if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
        return std::nullopt;
    }
    if (!root.isMember("free")) {
        return std::nullopt;
    }
    SpaceInfo info;
    info.free_bytes = json_bytes(root["free"]);
    info.available_bytes = info.free_bytes;
    if (root.isMember("total")) {
        info.total_bytes = json_bytes(root["total"]);
    } else {
        info.total_bytes = info.free_bytes + json_bytes(root["used"]);
    }
    return info;
}
