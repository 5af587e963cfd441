#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace httplib {
    struct Response;
}

namespace drive_bridge {

    std::string sse_event(const std::string &event, const std::string &data);

    std::string sse_comment(const std::string &text);

    // How often an idle stream checks that its client is still connected
    constexpr std::chrono::milliseconds kStreamLivenessPoll{250};

    // Streams a pool of `worker_threads` can hold while one worker stays free for POSTs
    size_t stream_capacity(int worker_threads);

    // Periodic deadline owned by one stream. Cancelling it wakes any waiter.
    class KeepaliveTimer {
    public:
        explicit KeepaliveTimer(std::chrono::milliseconds interval);

        enum class Wake { Tick, Idle, Cancelled };

        // Blocks until the next tick. Returns false once cancelled.
        bool wait_tick();

        // Like wait_tick(), but returns Idle after `slice` when no tick is due yet
        Wake wait_tick_for(std::chrono::milliseconds slice);

        void cancel();

        bool is_cancelled() const;

        std::chrono::milliseconds interval() const { return interval_; }

    private:
        std::chrono::milliseconds interval_;
        std::chrono::steady_clock::time_point next_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool cancelled_ = false;
    };

    // One long-lived event stream: queued opening frames, then keepalive comments
    // until the owning connection closes.
    class SseSession {
    public:
        using FrameWriter = std::function<bool(const std::string &frame)>;
        using LivenessCheck = std::function<bool()>;

        SseSession(std::string token, std::deque<std::string> opening_frames,
                   std::chrono::milliseconds keepalive);

        // Writes the next frame. While idle, `alive` is polled every kStreamLivenessPoll
        // and a false answer closes the session. Returns false when the stream must end.
        bool pump(const FrameWriter &write, const LivenessCheck &alive = nullptr);

        void close();

        bool is_closed() const;

        const std::string &token() const { return token_; }

        std::chrono::system_clock::time_point opened_at() const { return opened_at_; }

        size_t frames_written() const { return frames_written_.load(); }

        const KeepaliveTimer &timer() const { return timer_; }

    private:
        std::string token_;
        std::chrono::system_clock::time_point opened_at_;
        KeepaliveTimer timer_;
        mutable std::mutex mutex_;
        std::deque<std::string> pending_;
        bool closed_ = false;
        std::atomic<size_t> frames_written_{0};

        bool write_frame(const FrameWriter &write, const std::string &frame);
    };

    // Non-owning index of every open stream, used to close them on shutdown
    class SessionRegistry {
    public:
        explicit SessionRegistry(size_t capacity = std::numeric_limits<size_t>::max());

        // False when the registry is full or closed; a refused session is closed
        bool add(const std::shared_ptr<SseSession> &session);

        void remove(const SseSession *session);

        // Closes every open stream; streams added afterwards are closed on arrival until reopen()
        void close_all();

        void reopen();

        size_t size() const;

        size_t capacity() const { return capacity_; }

    private:
        size_t capacity_;
        mutable std::mutex mutex_;
        bool closed_ = false;
        std::unordered_map<const SseSession *, std::weak_ptr<SseSession>> sessions_;
    };

    // Turns the response into a text/event-stream fed by `session`. The session is
    // closed (and its timer cancelled) when the connection goes away. When the
    // registry refuses the session the response becomes a 503 and false is returned.
    bool attach_sse_stream(httplib::Response &res, const std::shared_ptr<SseSession> &session,
                           SessionRegistry &registry);

}
