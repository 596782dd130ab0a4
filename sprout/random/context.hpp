/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Per-call randomization context. Tracks the recursion path,
pools built instances per type and decides how cyclic type graphs are cut

**************************************************/

#ifndef SPROUT_RANDOM_CONTEXT_HPP
#define SPROUT_RANDOM_CONTEXT_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "sprout/error/exception.hpp"
#include "sprout/random/context_frame.hpp"
#include "sprout/random/object.hpp"
#include "sprout/random/parameters.hpp"
#include "sprout/random/randomizer_context.hpp"
#include "sprout/utils/random.hpp"

namespace sprout::random {

/**
 * @brief Raised when frames are popped without a matching push, or left on
 * the stack when the call completes. Signals a bug in the caller.
 */
class UnbalancedStackError : public sprout::error::Exception {
public:
    using sprout::error::Exception::Exception;
};

#define THROW_UNBALANCED_STACK(...)                         \
    throw sprout::random::UnbalancedStackError(             \
        SPROUT_FILE_NAME, SPROUT_FILE_LINE, SPROUT_FUNC_NAME, __VA_ARGS__)

/**
 * @brief State of a single top-level generation call.
 *
 * The population engine creates one context per call and drives it while
 * walking fields:
 * - before building an object it asks hasAlreadyFullyRandomized() and, if
 *   so, reuses pickPooledInstance() instead of building a fresh one;
 * - every built object goes through registerBuiltInstance(), every reused
 *   one through registerUsage();
 * - every descent into a field is bracketed by pushFrame()/popFrame() (or a
 *   ScopedFrame), guarded by exceedsMaxDepth().
 *
 * A context is neither thread-safe nor shareable between calls. The
 * parameters are held by reference and must outlive the context.
 */
class RandomizationContext : public RandomizerContext {
public:
    /**
     * @brief Pushes a frame on construction and pops it on destruction.
     *
     * The frame is popped only if it is still the top of the stack. When a
     * manual popFrame() or an unmatched pushFrame() inside the scope moved
     * the stack elsewhere, the destructor logs an error and leaves the stack
     * alone; ensureStackUnwound() then reports the imbalance.
     */
    class ScopedFrame {
    public:
        ScopedFrame(RandomizationContext& context, ObjectRef object,
                    Field field);
        ~ScopedFrame();

        ScopedFrame(const ScopedFrame&) = delete;
        auto operator=(const ScopedFrame&) -> ScopedFrame& = delete;

    private:
        RandomizationContext& context_;
        int depth_;
    };

    /**
     * @brief Seeds the pool-index engine from std::random_device.
     */
    RandomizationContext(std::type_index type,
                         const GenerationParameters& parameters);

    /**
     * @brief Seeds the pool-index engine explicitly, which makes the
     * sequence of pickPooledInstance() results reproducible.
     */
    RandomizationContext(std::type_index type,
                         const GenerationParameters& parameters,
                         std::uint32_t poolSeed);

    RandomizationContext(const RandomizationContext&) = delete;
    auto operator=(const RandomizationContext&)
        -> RandomizationContext& = delete;

    /**
     * @brief True once the pool of @p type holds objectPoolSize instances.
     */
    [[nodiscard]] auto hasAlreadyFullyRandomized(std::type_index type) const
        -> bool;

    /**
     * @brief Adds a freshly built instance to the pool of @p type. Instances
     * arriving once the pool is full are dropped.
     *
     * @throws InvalidArgument if @p object is null
     */
    void registerBuiltInstance(std::type_index type, ObjectRef object);

    /**
     * @brief Picks a pooled instance of @p type for reuse.
     *
     * The pick starts at a uniformly random pool index. With cycle avoidance
     * enabled, instances already used on the current path (by any stacked
     * frame or at root level) are skipped by scanning forward with
     * wrap-around. When none is left unused, the random pick is returned.
     *
     * @throws OutOfRange if the pool of @p type is empty
     */
    [[nodiscard]] auto pickPooledInstance(std::type_index type) -> ObjectRef;

    /**
     * @brief Records that @p object was reused, on the top frame or at root
     * level when no frame is active. No-op without cycle avoidance.
     */
    void registerUsage(std::type_index type, ObjectRef object);

    void pushFrame(ObjectRef object, Field field);

    /**
     * @throws UnbalancedStackError if no frame is active
     */
    void popFrame();

    /**
     * @throws UnbalancedStackError if frames are still active
     */
    void ensureStackUnwound() const;

    /**
     * @brief Lower-cased dotted path from the outermost stacked field down
     * to @p field, e.g. "order.item.price".
     */
    [[nodiscard]] auto fieldPath(const Field& field) const -> std::string;

    [[nodiscard]] auto exceedsMaxDepth() const -> bool;

    [[nodiscard]] auto isAtDeepestLevelAndShouldUseEmpty() const -> bool;

    /**
     * @brief Keeps the first non-null object as the call's result.
     */
    void setRootIfUnset(ObjectRef object);

    [[nodiscard]] auto pooledInstanceCount(std::type_index type) const
        -> std::size_t;

    [[nodiscard]] auto targetType() const -> std::type_index override;
    [[nodiscard]] auto currentObject() const -> ObjectRef override;
    [[nodiscard]] auto currentField() const -> std::string override;
    [[nodiscard]] auto currentRandomizationDepth() const -> int override;
    [[nodiscard]] auto rootObject() const -> ObjectRef override;
    [[nodiscard]] auto parameters() const
        -> const GenerationParameters& override;

private:
    using IndexRandom =
        utils::Random<std::mt19937, std::uniform_int_distribution<std::size_t>>;

    [[nodiscard]] auto alreadyUsedObjects(std::type_index type) const
        -> std::unordered_set<const void*>;
    [[nodiscard]] auto stackedFieldNames() const -> std::vector<std::string>;

    std::type_index type_;
    const GenerationParameters& parameters_;
    std::unordered_map<std::type_index, std::vector<ObjectRef>>
        populatedObjects_;
    std::vector<ContextFrame> stack_;
    ObjectRef rootObject_;
    std::unordered_map<std::type_index, ObjectRef> usedObjects_;
    IndexRandom random_;
};

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_CONTEXT_HPP
