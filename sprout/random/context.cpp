/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Per-call randomization context. Tracks the recursion path,
pools built instances per type and decides how cyclic type graphs are cut

**************************************************/

#include "context.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "sprout/utils/string.hpp"

namespace sprout::random {

RandomizationContext::ScopedFrame::ScopedFrame(RandomizationContext& context,
                                               ObjectRef object, Field field)
    : context_(context) {
    context_.pushFrame(std::move(object), std::move(field));
    depth_ = context_.currentRandomizationDepth();
}

RandomizationContext::ScopedFrame::~ScopedFrame() {
    if (context_.currentRandomizationDepth() != depth_) {
        spdlog::error(
            "Scoped frame pushed at depth {} left at depth {}, not popping",
            depth_, context_.currentRandomizationDepth());
        return;
    }
    context_.stack_.pop_back();
}

RandomizationContext::RandomizationContext(
    std::type_index type, const GenerationParameters& parameters)
    : RandomizationContext(type, parameters, std::random_device{}()) {}

RandomizationContext::RandomizationContext(
    std::type_index type, const GenerationParameters& parameters,
    std::uint32_t poolSeed)
    : type_(type), parameters_(parameters), random_(poolSeed) {
    spdlog::trace("Randomization context created for type {}", type_.name());
}

auto RandomizationContext::hasAlreadyFullyRandomized(
    std::type_index type) const -> bool {
    auto it = populatedObjects_.find(type);
    return it != populatedObjects_.end() &&
           it->second.size() ==
               static_cast<std::size_t>(parameters_.getObjectPoolSize());
}

void RandomizationContext::registerBuiltInstance(std::type_index type,
                                                 ObjectRef object) {
    if (!object) {
        THROW_INVALID_ARGUMENT("Cannot pool a null instance of type ",
                               type.name());
    }

    auto capacity = static_cast<std::size_t>(parameters_.getObjectPoolSize());
    auto& objects = populatedObjects_[type];
    if (objects.size() >= capacity) {
        spdlog::debug("Pool of type {} is full ({}), dropping instance",
                      type.name(), capacity);
        return;
    }
    if (objects.empty()) {
        objects.reserve(capacity);
    }
    objects.push_back(std::move(object));
}

auto RandomizationContext::pickPooledInstance(std::type_index type)
    -> ObjectRef {
    auto it = populatedObjects_.find(type);
    if (it == populatedObjects_.end() || it->second.empty()) {
        THROW_OUT_OF_RANGE("No pooled instance of type ", type.name());
    }

    const auto& objects = it->second;
    const std::size_t poolSize = objects.size();
    const std::size_t randomIndex =
        poolSize > 1 ? random_(IndexRandom::ParamType(0, poolSize - 1)) : 0;

    if (!parameters_.isAvoidInfiniteRecursion()) {
        return objects[randomIndex];
    }

    auto used = alreadyUsedObjects(type);
    if (used.size() < poolSize) {
        // Bounded scan: a pool holding the same instance twice may still
        // have no unused member.
        for (std::size_t offset = 0; offset < poolSize; ++offset) {
            const auto& candidate = objects[(randomIndex + offset) % poolSize];
            if (!used.contains(candidate.get())) {
                return candidate;
            }
        }
    }

    spdlog::debug(
        "Every pooled instance of type {} is already used on the current "
        "path, reusing index {}",
        type.name(), randomIndex);
    return objects[randomIndex];
}

void RandomizationContext::registerUsage(std::type_index type,
                                         ObjectRef object) {
    if (!parameters_.isAvoidInfiniteRecursion()) {
        return;
    }
    if (stack_.empty()) {
        usedObjects_.insert_or_assign(type, std::move(object));
    } else {
        stack_.back().registerUsage(type, std::move(object));
    }
}

void RandomizationContext::pushFrame(ObjectRef object, Field field) {
    spdlog::trace("Entering field '{}' at depth {}", field.name,
                  stack_.size());
    stack_.emplace_back(std::move(object), std::move(field));
}

void RandomizationContext::popFrame() {
    if (stack_.empty()) {
        THROW_UNBALANCED_STACK("popFrame() called without a matching push");
    }
    spdlog::trace("Leaving field '{}' at depth {}",
                  stack_.back().getField().name, stack_.size() - 1);
    stack_.pop_back();
}

void RandomizationContext::ensureStackUnwound() const {
    if (!stack_.empty()) {
        THROW_UNBALANCED_STACK(stack_.size(),
                               " frame(s) still active, innermost field '",
                               currentField(), "'");
    }
}

auto RandomizationContext::fieldPath(const Field& field) const
    -> std::string {
    auto names = stackedFieldNames();
    names.push_back(field.name);
    for (auto& name : names) {
        name = utils::toLower(name);
    }
    return utils::joinStrings(names, ".");
}

auto RandomizationContext::exceedsMaxDepth() const -> bool {
    return currentRandomizationDepth() > parameters_.getRandomizationDepth();
}

auto RandomizationContext::isAtDeepestLevelAndShouldUseEmpty() const -> bool {
    return parameters_.isAvoidNullsOnDeepestRecursionLevel() &&
           currentRandomizationDepth() == parameters_.getRandomizationDepth();
}

void RandomizationContext::setRootIfUnset(ObjectRef object) {
    if (!rootObject_) {
        rootObject_ = std::move(object);
    }
}

auto RandomizationContext::pooledInstanceCount(std::type_index type) const
    -> std::size_t {
    auto it = populatedObjects_.find(type);
    return it == populatedObjects_.end() ? 0 : it->second.size();
}

auto RandomizationContext::targetType() const -> std::type_index {
    return type_;
}

auto RandomizationContext::currentObject() const -> ObjectRef {
    if (stack_.empty()) {
        return rootObject_;
    }
    return stack_.back().getObject();
}

auto RandomizationContext::currentField() const -> std::string {
    return utils::joinStrings(stackedFieldNames(), ".");
}

auto RandomizationContext::currentRandomizationDepth() const -> int {
    return static_cast<int>(stack_.size());
}

auto RandomizationContext::rootObject() const -> ObjectRef {
    return rootObject_;
}

auto RandomizationContext::parameters() const -> const GenerationParameters& {
    return parameters_;
}

auto RandomizationContext::alreadyUsedObjects(std::type_index type) const
    -> std::unordered_set<const void*> {
    std::unordered_set<const void*> used;
    for (const auto& frame : stack_) {
        if (auto object = frame.getUsedObject(type)) {
            used.insert(object.get());
        }
    }
    if (auto it = usedObjects_.find(type); it != usedObjects_.end() &&
                                           it->second) {
        used.insert(it->second.get());
    }
    return used;
}

auto RandomizationContext::stackedFieldNames() const
    -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(stack_.size());
    for (const auto& frame : stack_) {
        names.push_back(frame.getField().name);
    }
    return names;
}

}  // namespace sprout::random
