#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace rampart::sandbox {

enum class OutputStream {
    kStdout,
    kStderr
};

inline const char* ToString(OutputStream stream) {
    return stream == OutputStream::kStdout ? "stdout" : "stderr";
}

struct OutputEvent {
    OutputStream stream = OutputStream::kStdout;
    std::string chunk;
};

// Ordered stream of output chunks from a running command. Chunks of one stream
// are delivered in arrival order; stdout and stderr are not ordered relative to
// each other. The producer closes the channel when the command finishes.
class OutputChannel {
public:
    void Publish(OutputEvent event);
    // Blocks until an event is available or the channel is closed and drained.
    bool Consume(OutputEvent& event);
    bool TryConsume(OutputEvent& event, std::chrono::milliseconds timeout);
    void Close();
    bool IsClosed() const;
    std::size_t Size() const;

private:
    std::queue<OutputEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

// Shared flag the caller sets to stop a running command. Copies observe the
// same flag.
class CancellationToken {
public:
    CancellationToken()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { cancelled_->store(true); }
    bool IsCancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace rampart::sandbox
