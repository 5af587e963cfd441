#pragma once

#include "common/url.hpp"

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace drive_bridge {

    // One POST forwarded to the upstream dispatcher. The upstream exchange runs on a
    // worker thread; the response head is handed over as soon as it arrives and the
    // body follows chunk by chunk, so the caller can stream it without buffering.
    class UpstreamRelay {
    public:
        struct Head {
            int status = 0;
            httplib::Headers headers;
        };

        UpstreamRelay(SplitUrl target, std::chrono::seconds timeout, httplib::Headers headers, std::string body);

        ~UpstreamRelay();

        UpstreamRelay(const UpstreamRelay &) = delete;
        UpstreamRelay &operator=(const UpstreamRelay &) = delete;

        // Sends the request and waits for the response head.
        // Throws BackendUnreachable when the upstream cannot be reached.
        Head start();

        // Blocks for the next body chunk. Returns false at end of body, on failure or after cancel().
        bool next_chunk(std::string &chunk);

        // True when the body ended abnormally (connection lost mid-stream)
        bool failed() const;

        void cancel();

    private:
        struct Channel {
            std::mutex mutex;
            std::condition_variable cv;
            std::optional<Head> head;
            std::deque<std::string> chunks;
            std::string error;
            bool done = false;
            bool failed = false;
            bool cancelled = false;
        };

        SplitUrl target_;
        std::chrono::seconds timeout_;
        httplib::Headers headers_;
        std::string body_;
        std::shared_ptr<Channel> channel_;
        std::thread worker_;

        static void run(std::shared_ptr<Channel> channel, SplitUrl target, std::chrono::seconds timeout,
                        httplib::Headers headers, std::string body);
    };

}
