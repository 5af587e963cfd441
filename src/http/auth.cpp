#include "http/auth.hpp"
#include "http/jsonrpc.hpp"
#include "common/errors.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace drive_bridge {

    namespace {

        std::string strip_scheme(const std::string &value) {
            auto space = value.find(' ');
            if (space == std::string::npos) {
                return value;
            }
            auto token_begin = value.find_first_not_of(' ', space);
            return token_begin == std::string::npos ? std::string() : value.substr(token_begin);
        }

    }

    AuthGuard::AuthGuard(std::string secret) : secret_(std::move(secret)) {
    }

    std::string AuthGuard::extract_token(const httplib::Request &req) {
        auto header = req.get_header_value("X-Bridge-Token");
        if (!header.empty()) {
            return header;
        }
        auto query = req.get_param_value("token");
        if (!query.empty()) {
            return query;
        }
        return strip_scheme(req.get_header_value("Authorization"));
    }

    void AuthGuard::check(const std::string &presented) const {
        if (secret_.empty()) {
            throw ConfigurationError("No shared secret configured (BRIDGE_TOKEN)");
        }
        if (presented.empty() || !constant_time_equals(presented, secret_)) {
            throw UnauthorizedError();
        }
    }

    bool AuthGuard::authorize(const httplib::Request &req, httplib::Response &res) const {
        try {
            check(extract_token(req));
            return true;
        } catch (const UnauthorizedError &) {
            spdlog::warn("Unauthorized {} {} from {}", req.method, req.path, req.remote_addr);
            send_auth_error(res);
        } catch (const ConfigurationError &e) {
            spdlog::error("Rejecting {} {}: {}", req.method, req.path, e.what());
            send_config_error(res, e.what());
        }
        return false;
    }

    bool constant_time_equals(const std::string &a, const std::string &b) {
        if (a.size() != b.size()) {
            return false;
        }
        unsigned char diff = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }

    void send_auth_error(httplib::Response &res) {
        res.status = 401;
        res.set_header("WWW-Authenticate", "Bearer realm=\"drive-bridge\"");
        res.set_content(make_error(nullptr, rpc_code::kUnauthorized, "Unauthorized").dump(), "application/json");
    }

    void send_config_error(httplib::Response &res, const std::string &reason) {
        res.status = 500;
        res.set_content(make_error(nullptr, rpc_code::kMisconfigured, "Server misconfigured: " + reason).dump(),
                        "application/json");
    }

}
