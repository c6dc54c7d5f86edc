#include "ctx7/transport/stdio_transport.hpp"
#include "ctx7/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace ctx7 {

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    try {
        read_loop(on_message, on_error);
    } catch (...) {
        stop_writer();
        throw;
    }
    stop_writer();
}

void StdioTransport::stop_writer() {
    // Let the writer flush what is queued, then stop it.
    running_ = false;
    connected_ = false;
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
}

void StdioTransport::read_loop(const MessageHandler& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    TransportError(std::string("Poll error: ") + std::strerror(errno))));
            }
            return;
        }

        if (fds[1].revents & POLLIN) return;  // shutdown()
        if (!(fds[0].revents & (POLLIN | POLLHUP))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    TransportError(std::string("Read error: ") + std::strerror(errno))));
            }
            return;
        }
        if (n == 0) {
            spdlog::info("stdin closed, ending stdio session");
            return;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        for (size_t nl; (nl = buffer.find('\n', pos)) != std::string::npos; pos = nl + 1) {
            std::string line = buffer.substr(pos, nl - pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) handle_line(line, on_message);
        }
        buffer.erase(0, pos);
    }
}

void StdioTransport::handle_line(const std::string& line, const MessageHandler& on_message) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const ParseError& e) {
        spdlog::warn("Dropping malformed stdio message: {}", e.what());
        enqueue(make_unaddressed_error(error::ParseError, e.what()).dump());
        return;
    }

    // Anything escaping the handler is not ours to swallow.
    auto reply = on_message(msg);
    if (reply) enqueue(Codec::serialize(*reply));
}

void StdioTransport::enqueue(std::string line) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(line));
    }
    write_cv_.notify_one();
}

void StdioTransport::write_loop() {
    while (true) {
        std::string out;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });
            if (write_queue_.empty()) return;
            out = std::move(write_queue_.front());
            write_queue_.pop();
        }

        out += '\n';
        const char* data = out.data();
        size_t remaining = out.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                spdlog::error("stdio write failed: {}", std::strerror(errno));
                connected_ = false;
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::wake_reader() {
    char b = 1;
    if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
        spdlog::warn("Failed to wake stdio reader: {}", std::strerror(errno));
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.load()) {
        write_cv_.notify_all();
        return;
    }
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace ctx7
