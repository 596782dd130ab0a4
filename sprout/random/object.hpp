/*
 * object.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Type-erased object handles and field descriptors exchanged
between the population engine and the randomization context

**************************************************/

#ifndef SPROUT_RANDOM_OBJECT_HPP
#define SPROUT_RANDOM_OBJECT_HPP

#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace sprout::random {

/**
 * @brief Shared handle to an object under construction.
 *
 * Identity is the address of the pointee: two handles refer to the same
 * instance iff get() compares equal, regardless of how they were obtained.
 */
using ObjectRef = std::shared_ptr<void>;

/**
 * @brief Descriptor of a field being populated.
 */
struct Field {
    std::string name;
    std::type_index type;

    Field(std::string fieldName, std::type_index fieldType)
        : name(std::move(fieldName)), type(fieldType) {}

    template <typename T>
    static auto of(std::string fieldName) -> Field {
        return Field(std::move(fieldName), std::type_index(typeid(T)));
    }
};

template <typename T>
[[nodiscard]] inline auto typeOf() -> std::type_index {
    return std::type_index(typeid(T));
}

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_OBJECT_HPP
