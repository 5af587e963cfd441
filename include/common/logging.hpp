#pragma once

#include <string>

namespace drive_bridge {

    void init_logging(const std::string &component, bool debug);

    // First `limit` characters of `text`, for log previews
    std::string preview(const std::string &text, size_t limit = 200);

    // Keeps the first and last characters of a secret, masks the rest
    std::string redact(const std::string &secret);

}
