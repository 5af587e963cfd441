#pragma once

#include "common/types.hpp"

#include <nlohmann/json.hpp>

namespace drive_bridge {

    class IBackendClient;

    constexpr int kDefaultSearchMax = 25;
    constexpr int kSearchMaxLimit = 100;

    // Namespace for the tool implementation functions
    namespace tools {

        ContentList search_files(IBackendClient &backend, const nlohmann::json &args);

        ContentList fetch_file(IBackendClient &backend, const nlohmann::json &args);

    }

}
