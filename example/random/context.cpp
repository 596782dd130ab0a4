/*
 * context.cpp
 *
 * Copyright (C) 2024 Max Q.
 *
 * Example usage of sprout::random::RandomizationContext driving the
 * population of a cyclic object graph
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "sprout/random/context.hpp"
#include "sprout/random/size_driven_populator.hpp"

using namespace sprout::random;

struct Employee;

struct Department {
    std::string name;
    std::shared_ptr<Employee> head;
    std::vector<std::shared_ptr<Employee>> staff;
};

struct Employee {
    std::string name;
    std::shared_ptr<Department> department;
};

// A tiny hand-written population engine for the two types above.
class CompanyPopulator : public SizeDrivenPopulator {
public:
    explicit CompanyPopulator(RandomizationContext& context)
        : SizeDrivenPopulator(context.parameters()), context_(context) {}

    auto department() -> std::shared_ptr<Department> {
        if (auto reused = reuse<Department>()) {
            return reused;
        }
        auto dept = std::make_shared<Department>();
        dept->name = "dept-" + std::to_string(departments_++);
        context_.setRootIfUnset(dept);
        context_.registerBuiltInstance(typeOf<Department>(), dept);

        {
            Field field = Field::of<Employee>("Head");
            RandomizationContext::ScopedFrame frame(context_, dept, field);
            if (!context_.exceedsMaxDepth()) {
                dept->head = employee();
            }
        }
        {
            Field field = Field::of<std::vector<Employee>>("Staff");
            RandomizationContext::ScopedFrame frame(context_, dept, field);
            if (!context_.exceedsMaxDepth()) {
                int size = getRandomSize();
                for (int i = 0; i < size; ++i) {
                    dept->staff.push_back(employee());
                }
            }
        }
        return dept;
    }

    auto employee() -> std::shared_ptr<Employee> {
        if (auto reused = reuse<Employee>()) {
            return reused;
        }
        auto person = std::make_shared<Employee>();
        person->name = "employee-" + std::to_string(employees_++);
        context_.registerBuiltInstance(typeOf<Employee>(), person);

        Field field = Field::of<Department>("Department");
        RandomizationContext::ScopedFrame frame(context_, person, field);
        if (!context_.exceedsMaxDepth()) {
            person->department = department();
        }
        return person;
    }

private:
    template <typename T>
    auto reuse() -> std::shared_ptr<T> {
        if (!context_.hasAlreadyFullyRandomized(typeOf<T>())) {
            return nullptr;
        }
        auto object =
            std::static_pointer_cast<T>(context_.pickPooledInstance(typeOf<T>()));
        context_.registerUsage(typeOf<T>(), object);
        return object;
    }

    RandomizationContext& context_;
    int departments_ = 0;
    int employees_ = 0;
};

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::debug);

    std::cout << "=== sprout RandomizationContext Example ===\n\n";

    GenerationParameters parameters;
    if (argc > 1) {
        try {
            parameters = GenerationParameters::loadFromFile(argv[1]);
        } catch (const sprout::error::Exception& e) {
            std::cerr << "Invalid parameters: " << e.getMessage() << "\n";
            return 1;
        }
    } else {
        parameters.setObjectPoolSize(3)
            .setRandomizationDepth(4)
            .setAvoidInfiniteRecursion(true)
            .setCollectionSizeRange(2, 5);
    }

    RandomizationContext context(typeOf<Department>(), parameters);
    CompanyPopulator populator(context);

    try {
        auto root = populator.department();
        context.ensureStackUnwound();

        std::cout << "Root department: " << root->name << "\n";
        std::cout << "  head: "
                  << (root->head ? root->head->name : std::string("<none>"))
                  << "\n";
        std::cout << "  staff:\n";
        for (const auto& person : root->staff) {
            std::cout << "    " << person->name << " -> "
                      << (person->department ? person->department->name
                                             : std::string("<none>"))
                      << "\n";
        }
        std::cout << "\nPooled departments: "
                  << context.pooledInstanceCount(typeOf<Department>())
                  << ", pooled employees: "
                  << context.pooledInstanceCount(typeOf<Employee>()) << "\n";
    } catch (const sprout::error::Exception& e) {
        spdlog::error("Generation failed at '{}': {}", context.currentField(),
                      e.what());
        return 1;
    }

    return 0;
}
