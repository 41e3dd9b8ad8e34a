#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "HttpTransport.hpp"

// In-memory resumable upload endpoint. Sessions are created by
// "POST <endpoint>/uploads" and addressed by the URL it hands out.
class FakeUploadServer : public HttpTransport {
   public:
    static constexpr const char* kEndpoint = "https://fake.test/v1";

    using Reply = std::tuple<bool, HttpResponse, HttpTransport::Error>;

    struct RecordedRequest {
        std::string command;
        std::string url;
        std::uint64_t offset = 0;
        std::uint64_t length = 0;
        std::string content_range;
    };

    struct Session {
        std::uint64_t total = 0;
        std::string content_type;
        std::string received;
        bool finalized = false;
        std::string token;
    };

    // Called for every chunk request with its index among all chunk
    // requests; a returned reply replaces the server's own handling.
    using ChunkHook = std::function<std::optional<Reply>(
        std::size_t index, const HttpRequest& request)>;

    Reply Perform(const HttpRequest& request,
                  const CancellationToken& cancel) noexcept override;

    // The server keeps only the first `confirmed` bytes of the session
    // after the chunk request with this index.
    void SetPartialAck(std::size_t chunk_index, std::uint64_t confirmed);
    void SetChunkHook(ChunkHook hook);
    void ExpireSession(const std::string& url);

    // Completing an upload answers 308 with the full range instead of the
    // token; the token is then only available through a status query.
    void SetWithholdToken(bool withhold);

    std::vector<RecordedRequest> Requests() const;
    std::vector<std::uint64_t> ChunkOffsets() const;
    std::size_t CountCommand(const std::string& command) const;
    std::optional<Session> GetSession(const std::string& url) const;
    std::size_t SessionCount() const;

    // Forwards to this server; for owners that need a transport per worker.
    std::unique_ptr<HttpTransport> MakeTransport();

   private:
    Reply HandleStart(const HttpRequest& request);
    Reply HandleUpload(const HttpRequest& request);
    Reply HandleQuery(const HttpRequest& request);

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    std::set<std::string> expired_;
    std::map<std::size_t, std::uint64_t> partial_acks_;
    std::vector<RecordedRequest> requests_;
    ChunkHook hook_;
    std::size_t chunk_requests_ = 0;
    std::size_t next_session_ = 1;
    bool withhold_token_ = false;
};
