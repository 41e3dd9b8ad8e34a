#include "MediaItemClient.hpp"

#include <google/protobuf/util/json_util.h>

#include "fmt/core.h"

#include "ResumableProtocol.hpp"
#include "UploaderLog.hpp"

namespace {
    UploadError MakeErr(long status, std::string message)
    {
        return UploadError{ UploadError::Kind::RegistrationFailed, status, 0, std::move(message) };
    }

    bool IsSuccessMessage(const std::string& message)
    {
        return message == "OK" || message == "Success";
    }
}

MediaItemClient::MediaItemClient(HttpTransport& transport, const UploaderConfig& config,
                                 std::shared_ptr<spdlog::logger> logger)
    : transport_(transport)
    , endpoint_(config.endpoint)
    , access_token_(config.access_token)
    , timeout_(config.request_timeout)
    , logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

std::tuple<bool, MediaItem, UploadError> MediaItemClient::Create(const std::string& upload_token, const std::string& file_name,
                                                                 const CancellationToken& cancel) noexcept
{
    if (upload_token.empty())
        return { false, MediaItem{}, MakeErr(0, "empty upload token") };

    BatchCreateMediaItemsRequest body;
    NewMediaItem* item = body.add_new_media_items();
    item->set_description(file_name);
    item->mutable_simple_media_item()->set_upload_token(upload_token);
    item->mutable_simple_media_item()->set_file_name(file_name);

    std::string json;
    const auto serialized = google::protobuf::util::MessageToJsonString(body, &json);
    if (!serialized.ok())
        return { false, MediaItem{}, MakeErr(0, "serialize request: " + serialized.ToString()) };

    HttpRequest request;
    request.url = JoinEndpoint(endpoint_, "mediaItems:batchCreate");
    request.headers = MakeBaseHeaders(access_token_);
    request.headers["Content-Type"] = "application/json";
    request.body = json;
    request.timeout = timeout_;

    auto [ok, response, err] = transport_.Perform(request, cancel);
    if (!ok) {
        UploadError uerr = UploadError::FromTransport(err, UploadError::Kind::RegistrationFailed, 0);
        return { false, MediaItem{}, std::move(uerr) };
    }

    if (response.status != kHttpOk)
        return { false, MediaItem{}, MakeErr(response.status,
                                             fmt::format("unexpected status {}: {}", response.status, response.body)) };

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    BatchCreateMediaItemsResponse parsed;
    const auto status = google::protobuf::util::JsonStringToMessage(response.body, &parsed, options);
    if (!status.ok())
        return { false, MediaItem{}, MakeErr(response.status, "malformed response: " + status.ToString()) };

    if (parsed.new_media_item_results_size() == 0)
        return { false, MediaItem{}, MakeErr(response.status, "response carries no media item result") };

    const NewMediaItemResult& result = parsed.new_media_item_results(0);
    if (!IsSuccessMessage(result.status().message()))
        return { false, MediaItem{}, MakeErr(response.status,
                                             fmt::format("media item rejected: code={} message=\"{}\"",
                                                         result.status().code(), result.status().message())) };

    logger_->info("[media] event=created file={} id={}", file_name, result.media_item().id());

    return { true, result.media_item(), UploadError{} };
}
