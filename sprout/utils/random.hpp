/*
 * random.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Engine and distribution bundled into one draw object

**************************************************/

#ifndef SPROUT_UTILS_RANDOM_HPP
#define SPROUT_UTILS_RANDOM_HPP

#include <concepts>
#include <random>
#include <type_traits>
#include <utility>

namespace sprout::utils {

template <typename T>
concept RandomEngine = requires(T engine) {
    typename T::result_type;
    { engine() } -> std::convertible_to<typename T::result_type>;
    { engine.min() } -> std::convertible_to<typename T::result_type>;
    { engine.max() } -> std::convertible_to<typename T::result_type>;
    { engine.seed() } -> std::same_as<void>;
};

template <typename T>
concept RandomDistribution = requires(T dist, std::mt19937& gen) {
    typename T::result_type;
    typename T::param_type;
    { dist(gen) } -> std::convertible_to<typename T::result_type>;
    { dist.param() } -> std::convertible_to<typename T::param_type>;
};

/**
 * @brief A random engine paired with the distribution it feeds.
 *
 * Two objects built from the same seed and distribution parameters produce
 * the same sequence of draws.
 *
 * @tparam Engine A UniformRandomBitGenerator (e.g., std::mt19937).
 * @tparam Distribution A distribution (e.g., std::uniform_int_distribution).
 */
template <RandomEngine Engine, RandomDistribution Distribution>
class Random {
public:
    using EngineType = Engine;
    using DistributionType = Distribution;
    using ResultType = typename DistributionType::result_type;
    using ParamType = typename DistributionType::param_type;
    using SeedType = typename EngineType::result_type;

private:
    EngineType engine_;
    DistributionType distribution_;

public:
    /**
     * @brief Seeds the engine explicitly and forwards the remaining arguments
     * to the distribution.
     */
    template <typename... Args>
    explicit Random(SeedType seed, Args&&... args) noexcept(
        std::is_nothrow_constructible_v<DistributionType, Args...>)
        : engine_(seed), distribution_(std::forward<Args>(args)...) {}

    [[nodiscard]] auto operator()() noexcept -> ResultType {
        return distribution_(engine_);
    }

    /**
     * @brief Draws with one-off distribution parameters, leaving the stored
     * parameters untouched.
     */
    [[nodiscard]] auto operator()(const ParamType& parm) noexcept
        -> ResultType {
        return distribution_(engine_, parm);
    }
};

}  // namespace sprout::utils

#endif  // SPROUT_UTILS_RANDOM_HPP
