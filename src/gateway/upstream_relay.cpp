#include "gateway/upstream_relay.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

namespace drive_bridge {

    UpstreamRelay::UpstreamRelay(SplitUrl target, std::chrono::seconds timeout, httplib::Headers headers,
                                 std::string body)
        : target_(std::move(target)),
          timeout_(timeout),
          headers_(std::move(headers)),
          body_(std::move(body)),
          channel_(std::make_shared<Channel>()) {
    }

    UpstreamRelay::~UpstreamRelay() {
        cancel();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    UpstreamRelay::Head UpstreamRelay::start() {
        worker_ = std::thread(&UpstreamRelay::run, channel_, target_, timeout_, std::move(headers_), std::move(body_));

        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->cv.wait(lock, [this] { return channel_->head.has_value() || channel_->done; });
        if (!channel_->head) {
            throw BackendUnreachable(channel_->error.empty() ? "no response from upstream" : channel_->error);
        }
        return *channel_->head;
    }

    bool UpstreamRelay::next_chunk(std::string &chunk) {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->cv.wait(lock, [this] {
            return !channel_->chunks.empty() || channel_->done || channel_->cancelled;
        });
        if (channel_->cancelled || channel_->chunks.empty()) {
            return false;
        }
        chunk = std::move(channel_->chunks.front());
        channel_->chunks.pop_front();
        return true;
    }

    bool UpstreamRelay::failed() const {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        return channel_->failed;
    }

    void UpstreamRelay::cancel() {
        {
            std::lock_guard<std::mutex> lock(channel_->mutex);
            channel_->cancelled = true;
        }
        channel_->cv.notify_all();
    }

    void UpstreamRelay::run(std::shared_ptr<Channel> channel, SplitUrl target, std::chrono::seconds timeout,
                            httplib::Headers headers, std::string body) {
        httplib::Client client(target.origin);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);

        httplib::Request req;
        req.method = "POST";
        req.path = target.path;
        req.headers = std::move(headers);
        req.body = std::move(body);

        req.response_handler = [channel](const httplib::Response &response) {
            std::lock_guard<std::mutex> lock(channel->mutex);
            channel->head = Head{response.status, response.headers};
            channel->cv.notify_all();
            return !channel->cancelled;
        };
        req.content_receiver = [channel](const char *data, size_t length, uint64_t, uint64_t) {
            std::lock_guard<std::mutex> lock(channel->mutex);
            if (channel->cancelled) {
                return false;
            }
            channel->chunks.emplace_back(data, length);
            channel->cv.notify_all();
            return true;
        };

        auto result = client.send(req);

        std::lock_guard<std::mutex> lock(channel->mutex);
        if (result && !channel->head) {
            // Bodiless responses (204) never reach the response handler
            channel->head = Head{result->status, result->headers};
        }
        if (!result) {
            channel->error = httplib::to_string(result.error());
            channel->failed = channel->head.has_value() && !channel->cancelled;
            if (channel->failed) {
                spdlog::warn("Upstream stream interrupted: {}", channel->error);
            }
        }
        channel->done = true;
        channel->cv.notify_all();
    }

}
