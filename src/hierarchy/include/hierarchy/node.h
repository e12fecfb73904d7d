#pragma once

#include <string>
#include <cstddef>

namespace arbor::hierarchy {
    // Read-only view of one vertex in a tree owned by someone else.
    struct Node {
        [[nodiscard]] virtual size_t childCount() const = 0;
        [[nodiscard]] virtual const Node *child(size_t index) const = 0;

        // nullptr for the root
        [[nodiscard]] virtual const Node *parent() const = 0;

        [[nodiscard]] virtual std::string name() const = 0;
        [[nodiscard]] virtual bool isActive() const = 0;

        // hosts may throw here if tag is not something they know about
        [[nodiscard]] virtual bool hasTag(const std::string &tag) const = 0;

        virtual ~Node() = default;
    };
}
