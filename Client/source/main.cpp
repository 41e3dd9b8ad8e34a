#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <getopt.h>
#include <signal.h>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "CurlTransport.hpp"
#include "SessionStore.hpp"
#include "UploadClient.hpp"
#include "UploaderConfig.hpp"

using ArgList = std::map<std::string, std::string>;

struct Arguments
{
    ArgList options;
    std::vector<std::string> files;
};

namespace {
    CancellationToken g_cancel;

    void HandleInterrupt(int)
    {
        g_cancel.Cancel();
    }

    std::optional<std::string> InstallInterruptHandler()
    {
        struct sigaction action {};
        action.sa_handler = HandleInterrupt;
        sigemptyset(&action.sa_mask);

        if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0)
            return std::string(std::strerror(errno));

        return std::nullopt;
    }
}

std::pair<bool, std::variant<Arguments, std::string>> ParseArgument(int argc, char* argv[])
{
    Arguments args;
    ArgList& arglist = args.options;

    const struct option options[] = {
            { "endpoint",      required_argument, nullptr, 'e' },
            { "access-token",  required_argument, nullptr, 't' },
            { "state-dir",     required_argument, nullptr, 's' },
            { "chunk-size",    required_argument, nullptr, 'c' },
            { "chunk-timeout", required_argument, nullptr, 'w' },
            { "jobs",          required_argument, nullptr, 'j' },
            { "loglevel",      required_argument, nullptr, 'l' },
            { "images",        no_argument,       nullptr, 'i' },
            { "register",      no_argument,       nullptr, 'r' },
            { nullptr, 0, nullptr, 0 }
    };

    try {
        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "e:t:s:c:w:j:l:ir", options, &optidx)) != -1; ) {
            switch (opt) {
            case 'e':
                arglist["endpoint"] = optarg;
                break;
            case 't':
                arglist["access-token"] = optarg;
                break;
            case 's':
                arglist["state-dir"] = optarg;
                break;
            case 'c':
                arglist["chunk-size"] = optarg;
                break;
            case 'w':
                arglist["chunk-timeout"] = optarg;
                break;
            case 'j':
                arglist["jobs"] = optarg;
                break;
            case 'l':
                arglist["loglevel"] = optarg;
                break;
            case 'i':
                arglist["images"] = "true";
                break;
            case 'r':
                arglist["register"] = "true";
                break;
            case ':':
                return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
            case '?':
                return { false, fmt::format("invalid argument: {}", argv[optind - 1]) };
            }
        }
    }
    catch (std::exception& e) {
        return { false, fmt::format("invalid argument: {}", e.what()) };
    }

    argc -= optind;
    if (argc < 1)
        return { false, fmt::format("usage: {} [--endpoint <url>] [--access-token <token>] [--state-dir <directory>] "
                                    "[--chunk-size <MiB>] [--chunk-timeout <seconds>] [--jobs <n>] "
                                    "[--loglevel <level>] [--images] [--register] <file>...", *argv) };

    argv += optind;

    for (int i = 0; i < argc; i++)
        args.files.emplace_back(argv[i]);

    if (arglist.find("endpoint") == arglist.end())
        arglist["endpoint"] = kDefaultEndpoint;

    if (arglist.find("access-token") == arglist.end()) {
        const char* env = std::getenv("GPHOTOS_ACCESS_TOKEN");
        arglist["access-token"] = env ? env : "";
    }

    if (arglist.find("state-dir") == arglist.end())
        arglist["state-dir"] = DefaultStateDir().string();

    if (arglist.find("chunk-size") == arglist.end())
        arglist["chunk-size"] = "10";

    if (arglist.find("chunk-timeout") == arglist.end())
        arglist["chunk-timeout"] = "30";

    if (arglist.find("jobs") == arglist.end())
        arglist["jobs"] = "1";

    if (arglist.find("loglevel") == arglist.end())
        arglist["loglevel"] = "info";

    return { true, args };
}

std::pair<bool, std::variant<UploaderConfig, std::string>> MakeConfig(const ArgList& arglist)
{
    UploaderConfig config;

    try {
        const unsigned long long chunk_mib = std::stoull(arglist.at("chunk-size"));
        if (chunk_mib == 0 || chunk_mib > 1024)
            return { false, fmt::format("chunk size must be 1-1024 MiB: {}", arglist.at("chunk-size")) };

        const unsigned long long timeout_sec = std::stoull(arglist.at("chunk-timeout"));
        if (timeout_sec == 0)
            return { false, "chunk timeout must be positive" };

        config.chunk_size = static_cast<std::size_t>(chunk_mib) * 1024 * 1024;
        config.chunk_timeout = std::chrono::seconds(timeout_sec);
    }
    catch (std::exception& e) {
        return { false, fmt::format("invalid number: {}", e.what()) };
    }

    config.endpoint = arglist.at("endpoint");
    config.access_token = arglist.at("access-token");
    config.state_dir = arglist.at("state-dir");
    config.category = arglist.count("images") ? MediaCategory::Photo : MediaCategory::Video;

    return { true, config };
}

void ShowArgument(const Arguments& args)
{
    for (const auto &[name, value]: args.options)
        spdlog::debug("{}: {}", name, name == "access-token" && !value.empty() ? "<redacted>" : value);

    for (const auto& file : args.files)
        spdlog::debug("file: {}", file);
}

int main(int argc, char* argv[])
{
    const auto &[success, result] = ParseArgument(argc, argv);
    if (!success) {
        spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
        return 1;
    }

    const Arguments& args = std::get<Arguments>(result);

    const auto level = spdlog::level::from_str(args.options.at("loglevel"));
    if (level == spdlog::level::off && args.options.at("loglevel") != "off") {
        spdlog::error("invalid log level: {}", args.options.at("loglevel"));
        return 1;
    }
    spdlog::set_level(level);

    ShowArgument(args);

    const auto &[config_ok, config_result] = MakeConfig(args.options);
    if (!config_ok) {
        spdlog::error("failed to MakeConfig(): {}", std::get<std::string>(config_result));
        return 1;
    }

    const UploaderConfig& config = std::get<UploaderConfig>(config_result);
    if (config.access_token.empty())
        spdlog::warn("no access token given: requests are sent without Authorization");

    std::size_t jobs = 1;
    try {
        jobs = std::stoul(args.options.at("jobs"));
    }
    catch (std::exception& e) {
        spdlog::error("invalid job count {}: {}", args.options.at("jobs"), e.what());
        return 1;
    }

    if (auto err = InstallInterruptHandler()) {
        spdlog::error("failed to install signal handler: {}", *err);
        return 1;
    }

    if (auto err = CurlTransport::GlobalInit()) {
        spdlog::error("failed to initialize libcurl: {}", err->message);
        return 1;
    }

    SessionStore store(config.state_dir);
    if (std::size_t purged = store.PurgeExpired(); purged > 0)
        spdlog::info("purged {} expired upload session(s) from {}", purged, config.state_dir.string());

    UploadClient client(config, store, [] { return std::make_unique<CurlTransport>(); },
                        args.options.count("register") > 0);

    std::vector<std::filesystem::path> files(args.files.begin(), args.files.end());
    const auto results = client.UploadFiles(files, jobs, g_cancel);

    CurlTransport::GlobalCleanup();

    std::size_t failed = 0;
    for (const auto& r : results) {
        if (r.success) {
            if (r.media_item_id.empty())
                spdlog::info("uploaded {}: token={}", r.path.string(), r.upload_token);
            else
                spdlog::info("uploaded {}: media_item={}", r.path.string(), r.media_item_id);
            continue;
        }

        spdlog::error("failed to upload {}: {}", r.path.string(), UploadErrorToString(r.error));
        failed++;
    }

    if (g_cancel.IsCancelled())
        spdlog::warn("interrupted: unfinished uploads resume on the next run");

    spdlog::info("{} of {} file(s) uploaded", results.size() - failed, results.size());

    return failed == 0 ? 0 : 1;
}
