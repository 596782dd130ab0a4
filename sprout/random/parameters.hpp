/*
 * parameters.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Immutable-by-convention generation parameters shared by a
randomization context and the populators it serves

**************************************************/

#ifndef SPROUT_RANDOM_PARAMETERS_HPP
#define SPROUT_RANDOM_PARAMETERS_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace sprout::random {

/**
 * @brief Closed-open interval [min, max).
 */
template <typename T>
struct Range {
    T min;
    T max;

    auto operator==(const Range&) const -> bool = default;
};

/**
 * @brief Parameters of one generation call.
 *
 * Setters validate their argument and return the object itself so that
 * configurations can be chained. A context only ever sees a const reference.
 */
class GenerationParameters {
public:
    static constexpr int DEFAULT_OBJECT_POOL_SIZE = 10;
    static constexpr int DEFAULT_RANDOMIZATION_DEPTH =
        std::numeric_limits<int>::max();
    static constexpr Range<int> DEFAULT_COLLECTION_SIZE_RANGE{1, 100};
    static constexpr std::int64_t DEFAULT_SEED = 123;

    GenerationParameters() = default;

    [[nodiscard]] auto getObjectPoolSize() const noexcept -> int {
        return objectPoolSize_;
    }
    [[nodiscard]] auto getRandomizationDepth() const noexcept -> int {
        return randomizationDepth_;
    }
    [[nodiscard]] auto isAvoidInfiniteRecursion() const noexcept -> bool {
        return avoidInfiniteRecursion_;
    }
    [[nodiscard]] auto isAvoidNullsOnDeepestRecursionLevel() const noexcept
        -> bool {
        return avoidNullsOnDeepestRecursionLevel_;
    }
    [[nodiscard]] auto getCollectionSizeRange() const noexcept -> Range<int> {
        return collectionSizeRange_;
    }
    [[nodiscard]] auto getSeed() const noexcept -> std::optional<std::int64_t> {
        return seed_;
    }

    /**
     * @throws InvalidArgument if size < 1
     */
    auto setObjectPoolSize(int size) -> GenerationParameters&;

    /**
     * @throws InvalidArgument if depth < 0
     */
    auto setRandomizationDepth(int depth) -> GenerationParameters&;

    auto setAvoidInfiniteRecursion(bool enabled) noexcept
        -> GenerationParameters&;

    auto setAvoidNullsOnDeepestRecursionLevel(bool enabled) noexcept
        -> GenerationParameters&;

    /**
     * @throws InvalidArgument if min < 0 or min > max
     */
    auto setCollectionSizeRange(int min, int max) -> GenerationParameters&;

    /**
     * @brief Sets the seed forwarded to size draws; std::nullopt makes them
     * non-reproducible.
     */
    auto setSeed(std::optional<std::int64_t> seed) noexcept
        -> GenerationParameters&;

    /**
     * @brief Builds parameters from a JSON object.
     *
     * Recognized keys are objectPoolSize, randomizationDepth,
     * avoidInfiniteRecursion, avoidNullsOnDeepestRecursionLevel,
     * collectionSizeRange ({"min", "max"}) and seed (integer or null).
     * Absent keys keep their default.
     *
     * @throws InvalidArgument on a non-object document, a mistyped key or an
     * out-of-range value
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& json)
        -> GenerationParameters;

    /**
     * @brief Reads a JSON file and hands it to fromJson().
     *
     * @throws FailToOpenFile if the file cannot be opened
     * @throws InvalidArgument if the file is not valid JSON
     */
    [[nodiscard]] static auto loadFromFile(const std::string& path)
        -> GenerationParameters;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    auto operator==(const GenerationParameters&) const -> bool = default;

private:
    int objectPoolSize_ = DEFAULT_OBJECT_POOL_SIZE;
    int randomizationDepth_ = DEFAULT_RANDOMIZATION_DEPTH;
    bool avoidInfiniteRecursion_ = false;
    bool avoidNullsOnDeepestRecursionLevel_ = false;
    Range<int> collectionSizeRange_ = DEFAULT_COLLECTION_SIZE_RANGE;
    std::optional<std::int64_t> seed_ = DEFAULT_SEED;
};

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_PARAMETERS_HPP
