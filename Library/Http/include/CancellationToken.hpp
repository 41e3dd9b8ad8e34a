#pragma once

#include <atomic>

// Shared between the thread that owns an upload and whoever may stop it
// (a signal handler, a supervising thread). Cancel() is async-signal-safe.
class CancellationToken
{
public:
	CancellationToken() = default;

	CancellationToken(const CancellationToken&) = delete;
	CancellationToken& operator=(const CancellationToken&) = delete;

public:
	void Cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
	bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
	std::atomic<bool> cancelled_{ false };
};
