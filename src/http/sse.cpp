#include "http/sse.hpp"
#include "http/jsonrpc.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace drive_bridge {

    std::string sse_event(const std::string &event, const std::string &data) {
        std::ostringstream frame;
        frame << "event: " << event << "\n";
        std::istringstream lines(data);
        std::string line;
        while (std::getline(lines, line)) {
            frame << "data: " << line << "\n";
        }
        if (data.empty()) {
            frame << "data: \n";
        }
        frame << "\n";
        return frame.str();
    }

    std::string sse_comment(const std::string &text) {
        return ": " + text + "\n\n";
    }

    size_t stream_capacity(int worker_threads) {
        return worker_threads > 1 ? static_cast<size_t>(worker_threads - 1) : 0;
    }

    KeepaliveTimer::KeepaliveTimer(std::chrono::milliseconds interval)
        : interval_(interval), next_(std::chrono::steady_clock::now() + interval) {
    }

    bool KeepaliveTimer::wait_tick() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, next_, [this] { return cancelled_; })) {
            return false;
        }
        next_ = std::chrono::steady_clock::now() + interval_;
        return true;
    }

    KeepaliveTimer::Wake KeepaliveTimer::wait_tick_for(std::chrono::milliseconds slice) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::chrono::steady_clock::time_point poll_at = std::chrono::steady_clock::now() + slice;
        auto until = std::min(next_, poll_at);
        if (cv_.wait_until(lock, until, [this] { return cancelled_; })) {
            return Wake::Cancelled;
        }
        if (std::chrono::steady_clock::now() < next_) {
            return Wake::Idle;
        }
        next_ = std::chrono::steady_clock::now() + interval_;
        return Wake::Tick;
    }

    void KeepaliveTimer::cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool KeepaliveTimer::is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    SseSession::SseSession(std::string token, std::deque<std::string> opening_frames,
                           std::chrono::milliseconds keepalive)
        : token_(std::move(token)),
          opened_at_(std::chrono::system_clock::now()),
          timer_(keepalive),
          pending_(std::move(opening_frames)) {
    }

    bool SseSession::pump(const FrameWriter &write, const LivenessCheck &alive) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (!pending_.empty()) {
                std::string frame = std::move(pending_.front());
                pending_.pop_front();
                lock.unlock();
                return write_frame(write, frame);
            }
        }

        for (;;) {
            auto wake = timer_.wait_tick_for(kStreamLivenessPoll);
            if (wake == KeepaliveTimer::Wake::Cancelled) {
                return false;
            }
            if (wake == KeepaliveTimer::Wake::Tick) {
                break;
            }
            if (alive && !alive()) {
                spdlog::debug("Stream client went away");
                close();
                return false;
            }
        }

        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return write_frame(write, sse_comment("ping " + std::to_string(now)));
    }

    bool SseSession::write_frame(const FrameWriter &write, const std::string &frame) {
        // Holding the lock across the write keeps close() from racing a frame onto a closed stream
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (!write(frame)) {
            closed_ = true;
            timer_.cancel();
            return false;
        }
        ++frames_written_;
        return true;
    }

    void SseSession::close() {
        timer_.cancel();
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        pending_.clear();
    }

    bool SseSession::is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    SessionRegistry::SessionRegistry(size_t capacity) : capacity_(capacity) {
    }

    bool SessionRegistry::add(const std::shared_ptr<SseSession> &session) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_ && sessions_.size() < capacity_) {
                sessions_[session.get()] = session;
                return true;
            }
        }
        session->close();
        return false;
    }

    void SessionRegistry::remove(const SseSession *session) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session);
    }

    void SessionRegistry::close_all() {
        std::unordered_map<const SseSession *, std::weak_ptr<SseSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            sessions.swap(sessions_);
        }
        size_t closed = 0;
        for (const auto &entry: sessions) {
            if (auto session = entry.second.lock()) {
                session->close();
                ++closed;
            }
        }
        if (closed > 0) {
            spdlog::info("Closed {} open streams", closed);
        }
    }

    void SessionRegistry::reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    size_t SessionRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    bool attach_sse_stream(httplib::Response &res, const std::shared_ptr<SseSession> &session,
                           SessionRegistry &registry) {
        res.set_header("Cache-Control", "no-store");

        if (!registry.add(session)) {
            spdlog::warn("Refusing stream: {} of {} slots in use", registry.size(), registry.capacity());
            res.status = 503;
            res.set_header("Retry-After", "5");
            res.set_content(make_error(nullptr, rpc_code::kServerError, "Too many open streams",
                                       nlohmann::json{{"kind", "stream_limit"}}).dump(),
                            "application/json");
            return false;
        }
        spdlog::debug("Stream opened ({} open)", registry.size());

        res.set_header("Connection", "keep-alive");
        res.set_header("X-Accel-Buffering", "no");

        res.set_chunked_content_provider(
            "text/event-stream",
            [session](size_t, httplib::DataSink &sink) {
                auto alive = [&sink] { return !sink.is_writable || sink.is_writable(); };
                return session->pump([&sink, &alive](const std::string &frame) {
                    return alive() && sink.write(frame.data(), frame.size());
                }, alive);
            },
            [session, &registry](bool) {
                session->close();
                registry.remove(session.get());
                spdlog::debug("Stream closed after {} frames ({} open)", session->frames_written(), registry.size());
            });
        return true;
    }

}
