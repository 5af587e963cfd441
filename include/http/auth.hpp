#pragma once

#include <string>

namespace httplib {
    struct Request;
    struct Response;
}

namespace drive_bridge {

    // Static shared-secret check. An unset secret authorizes no one.
    class AuthGuard {
    public:
        explicit AuthGuard(std::string secret);

        bool is_configured() const { return !secret_.empty(); }

        // X-Bridge-Token header, then ?token=, then Authorization with the scheme stripped
        static std::string extract_token(const httplib::Request &req);

        // Throws ConfigurationError when no secret is set, UnauthorizedError on mismatch
        void check(const std::string &presented) const;

        // Writes the failure response and returns false when the request is rejected
        bool authorize(const httplib::Request &req, httplib::Response &res) const;

    private:
        std::string secret_;
    };

    bool constant_time_equals(const std::string &a, const std::string &b);

    void send_auth_error(httplib::Response &res);

    void send_config_error(httplib::Response &res, const std::string &reason);

}
