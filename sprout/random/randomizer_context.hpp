/*
 * randomizer_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Read-only view of a generation call, handed to context-aware
randomizers

**************************************************/

#ifndef SPROUT_RANDOM_RANDOMIZER_CONTEXT_HPP
#define SPROUT_RANDOM_RANDOMIZER_CONTEXT_HPP

#include <string>
#include <typeindex>

#include "sprout/random/object.hpp"
#include "sprout/random/parameters.hpp"

namespace sprout::random {

/**
 * @brief What a randomizer may observe about the call it runs in.
 */
class RandomizerContext {
public:
    virtual ~RandomizerContext() = default;

    /**
     * @brief The type requested at the top of the call.
     */
    [[nodiscard]] virtual auto targetType() const -> std::type_index = 0;

    /**
     * @brief The object whose field is being populated, or the root object
     * outside of any field.
     */
    [[nodiscard]] virtual auto currentObject() const -> ObjectRef = 0;

    /**
     * @brief Dot-joined names of the fields on the current recursion path.
     */
    [[nodiscard]] virtual auto currentField() const -> std::string = 0;

    [[nodiscard]] virtual auto currentRandomizationDepth() const -> int = 0;

    [[nodiscard]] virtual auto rootObject() const -> ObjectRef = 0;

    [[nodiscard]] virtual auto parameters() const
        -> const GenerationParameters& = 0;
};

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_RANDOMIZER_CONTEXT_HPP
