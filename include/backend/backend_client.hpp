#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace drive_bridge {

    class IBackendClient {
    public:
        virtual ~IBackendClient() = default;

        virtual nlohmann::json search(const std::string &query, int max) = 0;

        virtual nlohmann::json fetch(const std::string &id, const std::optional<std::string> &lines) = 0;
    };

    // Unwraps {data: X} and {data: {data: X}} into X.
    // Throws BackendError for {ok: false} or a non-null error member.
    nlohmann::json normalize_envelope(const nlohmann::json &body);

    // Talks to the content API with one GET per action:
    //   <base_url>?action=<action>&token=<access_key>&<params...>
    class HttpBackendClient : public IBackendClient {
    public:
        explicit HttpBackendClient(BackendConfig config);

        nlohmann::json search(const std::string &query, int max) override;

        nlohmann::json fetch(const std::string &id, const std::optional<std::string> &lines) override;

        bool is_configured() const;

    private:
        BackendConfig config_;

        nlohmann::json call_action(const std::string &action,
                                   const std::vector<std::pair<std::string, std::string>> &params);
    };

}
