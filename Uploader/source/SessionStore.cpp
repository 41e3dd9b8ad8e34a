#include "SessionStore.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include "FileStream.hpp"
#include "UploaderLog.hpp"

namespace fs = std::filesystem;

using google::protobuf::util::TimeUtil;

namespace {
	SessionStore::Error MakeErr(int code, std::string msg)
	{
		return SessionStore::Error{ code, std::move(msg) };
	}

	SessionStore::Error MakeErrno(const std::string& context)
	{
		const int err = errno;
		return SessionStore::Error{ err, context + ": " + std::strerror(err) };
	}

	std::chrono::system_clock::time_point ToTimePoint(const google::protobuf::Timestamp& ts)
	{
		return std::chrono::system_clock::time_point(
			std::chrono::duration_cast<std::chrono::system_clock::duration>(
				std::chrono::microseconds(TimeUtil::TimestampToMicroseconds(ts))));
	}

	google::protobuf::Timestamp ToTimestamp(std::chrono::system_clock::time_point tp)
	{
		const auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
		return TimeUtil::MicrosecondsToTimestamp(us.count());
	}

	std::optional<SessionStore::Error> SyncFile(const fs::path& path, int flags)
	{
		const int fd = ::open(path.c_str(), flags);
		if (fd < 0)
			return MakeErrno("open " + path.string());

		std::optional<SessionStore::Error> result;
		if (::fsync(fd) != 0)
			result = MakeErrno("fsync " + path.string());

		::close(fd);
		return result;
	}
}

SessionStore::SessionStore(fs::path directory, std::shared_ptr<spdlog::logger> logger)
	: directory_(std::move(directory))
	, logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

fs::path SessionStore::RecordPath(const FileIdentity& identity) const
{
	return directory_ / (identity.slot + kRecordExtension);
}

std::optional<UploadSession> SessionStore::Load(const FileIdentity& identity) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	const fs::path path = RecordPath(identity);

	std::error_code ec;
	if (!fs::exists(path, ec)) {
		logger_->debug("[store] event=miss record={}", path.string());
		return std::nullopt;
	}

	auto [ok, record, err] = ReadRecord(path);
	if (!ok) {
		logger_->warn("[store] event=malformed record={} error=\"{}\"", path.string(), err.message);
		return std::nullopt;
	}

	const char* stale = nullptr;
	if (record.file_identity() != identity.key)
		stale = "identity";
	else if (record.file_path() != identity.path.string())
		stale = "path";
	else if (record.total_bytes() != identity.size)
		stale = "size";
	else if (record.confirmed_bytes() > record.total_bytes())
		stale = "offset";
	else if (record.upload_url().empty())
		stale = "url";

	if (stale) {
		logger_->info("[store] event=stale record={} mismatch={}", path.string(), stale);
		return std::nullopt;
	}

	UploadSession session;
	session.identity = identity;
	session.upload_url = record.upload_url();
	session.confirmed_bytes = record.confirmed_bytes();
	session.total_bytes = record.total_bytes();
	session.content_type = record.content_type();
	session.created_at = ToTimePoint(record.created_time());

	return session;
}

std::optional<SessionStore::Error> SessionStore::Save(const UploadSession& session) noexcept
{
	if (session.confirmed_bytes > session.total_bytes)
		return MakeErr(-1, "confirmed bytes exceed total bytes");
	if (session.identity.slot.empty())
		return MakeErr(-1, "session has no identity");

	UploadSessionRecord record;
	record.set_file_path(session.identity.path.string());
	record.set_file_identity(session.identity.key);
	record.set_upload_url(session.upload_url);
	record.set_confirmed_bytes(session.confirmed_bytes);
	record.set_total_bytes(session.total_bytes);
	record.set_content_type(session.content_type);
	*record.mutable_created_time() = ToTimestamp(session.created_at);
	*record.mutable_updated_time() = TimeUtil::GetCurrentTime();

	std::lock_guard<std::mutex> lock(mutex_);

	return WriteRecord(RecordPath(session.identity), record);
}

void SessionStore::Delete(const FileIdentity& identity) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	const fs::path path = RecordPath(identity);

	std::error_code ec;
	if (fs::remove(path, ec)) {
		logger_->debug("[store] event=delete record={}", path.string());
		return;
	}

	if (ec)
		logger_->warn("[store] event=delete_failed record={} error=\"{}\"", path.string(), ec.message());
}

std::size_t SessionStore::PurgeExpired(std::chrono::hours max_age) noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::error_code ec;
	if (!fs::is_directory(directory_, ec))
		return 0;

	const auto deadline = std::chrono::system_clock::now() - max_age;
	std::size_t removed = 0;

	for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
		const fs::path& path = it->path();
		if (path.extension() != kRecordExtension)
			continue;

		auto [ok, record, err] = ReadRecord(path);
		if (!ok) {
			logger_->debug("[store] event=purge_skip record={} error=\"{}\"", path.string(), err.message);
			continue;
		}

		if (ToTimePoint(record.updated_time()) >= deadline)
			continue;

		std::error_code rm_ec;
		if (fs::remove(path, rm_ec)) {
			logger_->info("[store] event=purge record={} updated={}", path.string(),
				      TimeUtil::ToString(record.updated_time()));
			removed++;
		} else if (rm_ec) {
			logger_->warn("[store] event=purge_failed record={} error=\"{}\"", path.string(), rm_ec.message());
		}
	}

	if (ec)
		logger_->warn("[store] event=purge_scan_failed dir={} error=\"{}\"", directory_.string(), ec.message());

	return removed;
}

std::tuple<bool, UploadSessionRecord, SessionStore::Error> SessionStore::ReadRecord(const fs::path& path) const noexcept
{
	FileStream stream(path);
	if (auto err = stream.Open(std::ios::binary | std::ios::in))
		return { false, UploadSessionRecord{}, MakeErr(err->code, err->message) };

	auto [size_ok, size, size_err] = stream.Size();
	if (!size_ok)
		return { false, UploadSessionRecord{}, MakeErr(size_err.code, size_err.message) };

	std::string json(static_cast<std::size_t>(size), '\0');
	auto [read_ok, n, read_err] = stream.Read(json);
	if (!read_ok)
		return { false, UploadSessionRecord{}, MakeErr(read_err.code, read_err.message) };

	json.resize(static_cast<std::size_t>(n));

	google::protobuf::util::JsonParseOptions options;
	options.ignore_unknown_fields = true;

	UploadSessionRecord record;
	const auto status = google::protobuf::util::JsonStringToMessage(json, &record, options);
	if (!status.ok())
		return { false, UploadSessionRecord{}, MakeErr(-1, status.ToString()) };

	return { true, std::move(record), MakeErr(0, "") };
}

std::optional<SessionStore::Error> SessionStore::WriteRecord(const fs::path& path, const UploadSessionRecord& record) noexcept
{
	google::protobuf::util::JsonPrintOptions options;
	options.add_whitespace = true;
	options.always_print_primitive_fields = true;
	options.preserve_proto_field_names = true;

	std::string json;
	const auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
	if (!status.ok())
		return MakeErr(-1, "serialize record: " + status.ToString());

	std::error_code ec;
	fs::create_directories(directory_, ec);
	if (ec)
		return MakeErr(ec.value(), "create " + directory_.string() + ": " + ec.message());

	fs::path tmp = path;
	tmp += ".tmp";

	FileStream stream(tmp);
	if (auto err = stream.Open(std::ios::binary | std::ios::out | std::ios::trunc))
		return MakeErr(err->code, err->message);

	if (auto err = stream.Write(json)) {
		(void)stream.Close();
		fs::remove(tmp, ec);
		return MakeErr(err->code, err->message);
	}

	if (auto err = stream.Close()) {
		fs::remove(tmp, ec);
		return MakeErr(err->code, err->message);
	}

	if (auto err = SyncFile(tmp, O_RDONLY)) {
		fs::remove(tmp, ec);
		return err;
	}

	fs::rename(tmp, path, ec);
	if (ec) {
		const Error err = MakeErr(ec.value(), "rename " + tmp.string() + ": " + ec.message());
		fs::remove(tmp, ec);
		return err;
	}

	// Persist the rename itself.
	if (auto err = SyncFile(directory_, O_RDONLY | O_DIRECTORY))
		logger_->debug("[store] event=dir_sync_failed dir={} error=\"{}\"", directory_.string(), err->message);

	return std::nullopt;
}
