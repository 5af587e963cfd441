#include "common/url.hpp"
#include "common/errors.hpp"

namespace drive_bridge {

    SplitUrl split_url(const std::string &url) {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos) {
            throw ConfigurationError("URL has no scheme: " + url);
        }
        std::string scheme = url.substr(0, scheme_end);
        if (scheme != "http" && scheme != "https") {
            throw ConfigurationError("Unsupported URL scheme '" + scheme + "' in " + url);
        }

        auto host_begin = scheme_end + 3;
        auto path_begin = url.find_first_of("/?", host_begin);
        std::string host = url.substr(host_begin, path_begin == std::string::npos
                                                      ? std::string::npos
                                                      : path_begin - host_begin);
        if (host.empty()) {
            throw ConfigurationError("URL has no host: " + url);
        }

        SplitUrl split;
        split.origin = scheme + "://" + host;
        split.path = path_begin == std::string::npos ? "/" : url.substr(path_begin);
        if (split.path.front() == '?') {
            split.path.insert(split.path.begin(), '/');
        }
        return split;
    }

}
