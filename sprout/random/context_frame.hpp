/*
 * context_frame.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: One recursion step of a randomization context

**************************************************/

#ifndef SPROUT_RANDOM_CONTEXT_FRAME_HPP
#define SPROUT_RANDOM_CONTEXT_FRAME_HPP

#include <typeindex>
#include <unordered_map>

#include "sprout/random/object.hpp"

namespace sprout::random {

/**
 * @brief The population of a single field of a single object.
 *
 * Besides the object and field, a frame remembers the latest instance of
 * each type reused while it was the top of the stack. A later usage of the
 * same type replaces the earlier one.
 */
class ContextFrame {
public:
    ContextFrame(ObjectRef object, Field field);

    [[nodiscard]] auto getObject() const noexcept -> const ObjectRef& {
        return object_;
    }

    [[nodiscard]] auto getField() const noexcept -> const Field& {
        return field_;
    }

    void registerUsage(std::type_index type, ObjectRef object);

    /**
     * @return the instance last registered for @p type, or nullptr.
     */
    [[nodiscard]] auto getUsedObject(std::type_index type) const -> ObjectRef;

private:
    ObjectRef object_;
    Field field_;
    std::unordered_map<std::type_index, ObjectRef> usedObjects_;
};

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_CONTEXT_FRAME_HPP
