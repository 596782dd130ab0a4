/*
 * context_frame.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: One recursion step of a randomization context

**************************************************/

#include "context_frame.hpp"

#include <utility>

namespace sprout::random {

ContextFrame::ContextFrame(ObjectRef object, Field field)
    : object_(std::move(object)), field_(std::move(field)) {}

void ContextFrame::registerUsage(std::type_index type, ObjectRef object) {
    usedObjects_.insert_or_assign(type, std::move(object));
}

auto ContextFrame::getUsedObject(std::type_index type) const -> ObjectRef {
    auto it = usedObjects_.find(type);
    if (it == usedObjects_.end()) {
        return nullptr;
    }
    return it->second;
}

}  // namespace sprout::random
