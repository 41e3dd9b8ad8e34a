#include "UploadClient.hpp"

#include <algorithm>
#include <thread>

#include "MediaItemClient.hpp"
#include "UploadOrchestrator.hpp"
#include "UploaderLog.hpp"

namespace fs = std::filesystem;

UploadClient::UploadClient(const UploaderConfig& config, SessionStore& store, TransportFactory factory,
                           bool register_items, std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , store_(store)
    , factory_(std::move(factory))
    , register_items_(register_items)
    , logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

std::vector<UploadClient::Result> UploadClient::UploadFiles(const std::vector<fs::path>& files, std::size_t jobs,
                                                            const CancellationToken& cancel)
{
    std::vector<Result> results(files.size());
    for (std::size_t i = 0; i < files.size(); i++) {
        results[i].path = files[i];
        results[i].error = UploadError{ UploadError::Kind::Cancelled, 0, 0, "not started" };
    }

    jobs = std::clamp<std::size_t>(jobs, 1, std::max<std::size_t>(files.size(), 1));

    std::size_t next = 0;
    std::mutex next_mutex;

    std::vector<std::thread> workers;
    workers.reserve(jobs);
    for (std::size_t i = 0; i < jobs; i++)
        workers.emplace_back(&UploadClient::RunWorker, this, std::cref(files), std::ref(results),
                             std::ref(next), std::ref(next_mutex), std::cref(cancel));

    for (auto& worker : workers)
        worker.join();

    return results;
}

void UploadClient::RunWorker(const std::vector<fs::path>& files, std::vector<Result>& results,
                             std::size_t& next, std::mutex& next_mutex, const CancellationToken& cancel)
{
    std::unique_ptr<HttpTransport> transport;
    std::string transport_error;
    try {
        transport = factory_();
    }
    catch (std::exception& e) {
        transport_error = e.what();
    }

    if (!transport) {
        if (transport_error.empty())
            transport_error = "factory returned no transport";

        logger_->error("[client] event=transport_failed error=\"{}\"", transport_error);
    }

    while (!cancel.IsCancelled()) {
        std::size_t index;
        {
            std::lock_guard<std::mutex> lock(next_mutex);
            if (next >= files.size())
                return;

            index = next++;
        }

        if (!transport) {
            results[index].error = UploadError{ UploadError::Kind::SessionStartFailed, 0, 0,
                                                "transport unavailable: " + transport_error };
            continue;
        }

        results[index] = UploadOne(*transport, files[index], cancel);
    }
}

UploadClient::Result UploadClient::UploadOne(HttpTransport& transport, const fs::path& path, const CancellationToken& cancel)
{
    Result result;
    result.path = path;

    UploadOrchestrator orchestrator(transport, store_, config_, logger_);
    orchestrator.SetProgressObserver([this](const UploadProgress& progress) {
        const double percent = progress.total_bytes == 0
            ? 100.0 : 100.0 * static_cast<double>(progress.confirmed_bytes) / static_cast<double>(progress.total_bytes);
        logger_->info("{}: {}/{} bytes ({:.1f}%){}", progress.path.filename().string(),
                      progress.confirmed_bytes, progress.total_bytes, percent, progress.complete ? " complete" : "");
    });

    auto [uploaded, token, err] = orchestrator.Upload(path, cancel);
    if (!uploaded) {
        result.error = err;
        return result;
    }

    result.upload_token = token;

    if (register_items_) {
        MediaItemClient media(transport, config_, logger_);

        auto [created, item, merr] = media.Create(token, path.filename().string(), cancel);
        if (!created) {
            result.error = merr;
            return result;
        }

        result.media_item_id = item.id();
    }

    result.success = true;
    return result;
}
