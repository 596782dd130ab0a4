/*
 * parameters.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Immutable-by-convention generation parameters shared by a
randomization context and the populators it serves

**************************************************/

#include "parameters.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sprout/error/exception.hpp"

namespace sprout::random {

namespace {
auto readInt(const nlohmann::json& json, const char* key) -> int {
    const auto& value = json.at(key);
    if (!value.is_number_integer()) {
        THROW_INVALID_ARGUMENT("'", key, "' must be an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        THROW_INVALID_ARGUMENT("'", key, "' is out of int range: ",
                               value.get<std::uint64_t>());
    }
    auto wide = value.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() ||
        wide > std::numeric_limits<int>::max()) {
        THROW_INVALID_ARGUMENT("'", key, "' is out of int range: ", wide);
    }
    return static_cast<int>(wide);
}

auto readBool(const nlohmann::json& json, const char* key) -> bool {
    const auto& value = json.at(key);
    if (!value.is_boolean()) {
        THROW_INVALID_ARGUMENT("'", key, "' must be a boolean");
    }
    return value.get<bool>();
}
}  // namespace

auto GenerationParameters::setObjectPoolSize(int size)
    -> GenerationParameters& {
    if (size < 1) {
        THROW_INVALID_ARGUMENT("objectPoolSize must be >= 1, got ", size);
    }
    objectPoolSize_ = size;
    return *this;
}

auto GenerationParameters::setRandomizationDepth(int depth)
    -> GenerationParameters& {
    if (depth < 0) {
        THROW_INVALID_ARGUMENT("randomizationDepth must be >= 0, got ", depth);
    }
    randomizationDepth_ = depth;
    return *this;
}

auto GenerationParameters::setAvoidInfiniteRecursion(bool enabled) noexcept
    -> GenerationParameters& {
    avoidInfiniteRecursion_ = enabled;
    return *this;
}

auto GenerationParameters::setAvoidNullsOnDeepestRecursionLevel(
    bool enabled) noexcept -> GenerationParameters& {
    avoidNullsOnDeepestRecursionLevel_ = enabled;
    return *this;
}

auto GenerationParameters::setCollectionSizeRange(int min, int max)
    -> GenerationParameters& {
    if (min < 0) {
        THROW_INVALID_ARGUMENT("collectionSizeRange min must be >= 0, got ",
                               min);
    }
    if (min > max) {
        THROW_INVALID_ARGUMENT("collectionSizeRange min (", min,
                               ") must be <= max (", max, ")");
    }
    collectionSizeRange_ = Range<int>{min, max};
    return *this;
}

auto GenerationParameters::setSeed(std::optional<std::int64_t> seed) noexcept
    -> GenerationParameters& {
    seed_ = seed;
    return *this;
}

auto GenerationParameters::fromJson(const nlohmann::json& json)
    -> GenerationParameters {
    if (!json.is_object()) {
        THROW_INVALID_ARGUMENT("generation parameters must be a JSON object");
    }

    GenerationParameters parameters;
    if (json.contains("objectPoolSize")) {
        parameters.setObjectPoolSize(readInt(json, "objectPoolSize"));
    }
    if (json.contains("randomizationDepth")) {
        parameters.setRandomizationDepth(readInt(json, "randomizationDepth"));
    }
    if (json.contains("avoidInfiniteRecursion")) {
        parameters.setAvoidInfiniteRecursion(
            readBool(json, "avoidInfiniteRecursion"));
    }
    if (json.contains("avoidNullsOnDeepestRecursionLevel")) {
        parameters.setAvoidNullsOnDeepestRecursionLevel(
            readBool(json, "avoidNullsOnDeepestRecursionLevel"));
    }
    if (json.contains("collectionSizeRange")) {
        const auto& range = json.at("collectionSizeRange");
        if (!range.is_object()) {
            THROW_INVALID_ARGUMENT(
                "'collectionSizeRange' must be an object with min and max");
        }
        auto current = parameters.getCollectionSizeRange();
        int min = range.contains("min") ? readInt(range, "min") : current.min;
        int max = range.contains("max") ? readInt(range, "max") : current.max;
        parameters.setCollectionSizeRange(min, max);
    }
    if (json.contains("seed")) {
        const auto& seed = json.at("seed");
        if (seed.is_null()) {
            parameters.setSeed(std::nullopt);
        } else if (seed.is_number_unsigned() &&
                   seed.get<std::uint64_t>() >
                       static_cast<std::uint64_t>(
                           std::numeric_limits<std::int64_t>::max())) {
            THROW_INVALID_ARGUMENT("'seed' is out of int64 range: ",
                                   seed.get<std::uint64_t>());
        } else if (seed.is_number_integer()) {
            parameters.setSeed(seed.get<std::int64_t>());
        } else {
            THROW_INVALID_ARGUMENT("'seed' must be an integer or null");
        }
    }
    return parameters;
}

auto GenerationParameters::loadFromFile(const std::string& path)
    -> GenerationParameters {
    spdlog::info("Loading generation parameters from {}", path);

    std::ifstream file(path);
    if (!file) {
        spdlog::error("Failed to open file for reading: {}", path);
        THROW_FAIL_TO_OPEN_FILE("Failed to open file: ", path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse JSON file '{}': {}", path, e.what());
        THROW_INVALID_ARGUMENT("Malformed JSON in ", path, ": ", e.what());
    }
    return fromJson(json);
}

auto GenerationParameters::toJson() const -> nlohmann::json {
    nlohmann::json json;
    json["objectPoolSize"] = objectPoolSize_;
    json["randomizationDepth"] = randomizationDepth_;
    json["avoidInfiniteRecursion"] = avoidInfiniteRecursion_;
    json["avoidNullsOnDeepestRecursionLevel"] =
        avoidNullsOnDeepestRecursionLevel_;
    json["collectionSizeRange"] = {{"min", collectionSizeRange_.min},
                                   {"max", collectionSizeRange_.max}};
    if (seed_) {
        json["seed"] = *seed_;
    } else {
        json["seed"] = nullptr;
    }
    return json;
}

}  // namespace sprout::random
