#pragma once

#include <string>
#include <vector>

namespace httplib {
    struct Request;
    struct Response;
}

namespace drive_bridge {

    class CorsPolicy {
    public:
        explicit CorsPolicy(std::vector<std::string> allowed_origins);

        // Exact allow-list match echoes the origin, anything else gets "*"
        std::string allow_origin(const std::string &origin) const;

        bool is_allowed(const std::string &origin) const;

        void apply(const httplib::Request &req, httplib::Response &res) const;

    private:
        std::vector<std::string> allowed_origins_;
    };

}
