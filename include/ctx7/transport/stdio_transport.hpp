#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>

namespace ctx7 {

/// Reads newline-delimited JSON-RPC from an input fd and writes replies,
/// one per line, to an output fd. Messages are handled one at a time in
/// arrival order on the reader; a writer thread drains the reply queue.
class StdioTransport : public ITransport {
public:
    /// Bind to the process's stdin/stdout.
    StdioTransport();

    /// Bind to the given descriptors. The transport does not close them.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageHandler& on_message, const ErrorCallback& on_error);
    void handle_line(const std::string& line, const MessageHandler& on_message);
    void write_loop();
    void stop_writer();
    void enqueue(std::string line);
    void wake_reader();

    int read_fd_;
    int write_fd_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};
};

} // namespace ctx7
