#pragma once

#include <string>

namespace drive_bridge {

    struct SplitUrl {
        std::string origin;  // scheme://host[:port], as accepted by httplib::Client
        std::string path;    // always starts with '/'
    };

    // Throws ConfigurationError when the URL has no http(s) scheme or no host
    SplitUrl split_url(const std::string &url);

}
