#include "tools/drive_tools.hpp"
#include "backend/backend_client.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace drive_bridge {
    namespace tools {

        namespace {

            int search_max(const nlohmann::json &args) {
                auto it = args.find("max");
                if (it == args.end() || it->is_null()) {
                    return kDefaultSearchMax;
                }
                double requested = 0;
                if (it->is_number()) {
                    requested = it->get<double>();
                } else if (it->is_string()) {
                    try {
                        requested = std::stod(it->get<std::string>());
                    } catch (const std::exception &) {
                        throw InvalidArgumentsError("max must be a number");
                    }
                } else {
                    throw InvalidArgumentsError("max must be a number");
                }
                if (!std::isfinite(requested)) {
                    throw InvalidArgumentsError("max must be a finite number");
                }
                return static_cast<int>(std::clamp(requested, 1.0, static_cast<double>(kSearchMaxLimit)));
            }

            std::optional<std::string> line_range(const nlohmann::json &args) {
                auto it = args.find("lines");
                if (it == args.end() || it->is_null()) {
                    return std::nullopt;
                }
                if (it->is_string()) {
                    return it->get<std::string>();
                }
                if (it->is_number_unsigned()) {
                    return std::to_string(it->get<std::uint64_t>());
                }
                if (it->is_number_integer()) {
                    return std::to_string(it->get<std::int64_t>());
                }
                if (it->is_number()) {
                    double requested = std::trunc(it->get<double>());
                    // 2^63; the cast below is only defined strictly inside this range
                    constexpr double limit = 9223372036854775808.0;
                    if (!std::isfinite(requested) || requested >= limit || requested < -limit) {
                        throw InvalidArgumentsError("lines is out of range");
                    }
                    return std::to_string(static_cast<std::int64_t>(requested));
                }
                throw InvalidArgumentsError("lines must be a number or a string");
            }

        }

        ContentList search_files(IBackendClient &backend, const nlohmann::json &args) {
            std::string query;
            auto q = args.find("q");
            if (q != args.end() && !q->is_null()) {
                if (!q->is_string()) {
                    throw InvalidArgumentsError("q must be a string");
                }
                query = q->get<std::string>();
            }

            nlohmann::json files = backend.search(query, search_max(args));
            return {ContentBlock::make_json(std::move(files))};
        }

        ContentList fetch_file(IBackendClient &backend, const nlohmann::json &args) {
            auto id = args.find("id");
            if (id == args.end() || !id->is_string() || id->get<std::string>().empty()) {
                throw InvalidArgumentsError("Missing required argument: id");
            }

            nlohmann::json file = backend.fetch(id->get<std::string>(), line_range(args));

            if (file.is_object()) {
                auto is_inline = file.find("inline");
                auto text = file.find("text");
                if (is_inline != file.end() && is_inline->is_boolean() && is_inline->get<bool>() &&
                    text != file.end() && text->is_string()) {
                    return {ContentBlock::make_text(text->get<std::string>())};
                }
            }
            return {ContentBlock::make_json(std::move(file))};
        }

    }
}
