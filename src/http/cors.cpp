#include "http/cors.hpp"

#include <httplib.h>

#include <algorithm>

namespace drive_bridge {

    CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins)
        : allowed_origins_(std::move(allowed_origins)) {
    }

    bool CorsPolicy::is_allowed(const std::string &origin) const {
        return !origin.empty() &&
               std::find(allowed_origins_.begin(), allowed_origins_.end(), origin) != allowed_origins_.end();
    }

    std::string CorsPolicy::allow_origin(const std::string &origin) const {
        return is_allowed(origin) ? origin : "*";
    }

    void CorsPolicy::apply(const httplib::Request &req, httplib::Response &res) const {
        auto origin = req.get_header_value("Origin");
        res.set_header("Access-Control-Allow-Origin", allow_origin(origin));
        res.set_header("Vary", "Origin");
        if (is_allowed(origin)) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
        res.set_header("Access-Control-Allow-Headers",
                       "Content-Type, Authorization, X-Bridge-Token, X-Custom-Auth-Headers, Accept");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, HEAD, OPTIONS");
    }

}
