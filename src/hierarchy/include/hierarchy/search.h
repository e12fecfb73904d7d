#pragma once

#include <hierarchy/node.h>

#include <string>
#include <vector>
#include <functional>

namespace arbor::hierarchy {
    namespace search {
        using Checker = std::function<bool(const Node *)>;

        enum class Order {
            DepthFirst,
            BreadthFirst,
        };

        Checker named(std::string name);
        Checker tagged(std::string tag);

        // origin is never part of the results, only its children and their subtrees
        const Node *descendant(
            const Node *origin, const Checker &checker, bool mustBeActive, Order order = Order::DepthFirst);
        std::vector<const Node *> descendants(const Node *origin, const Checker &checker, bool mustBeActive);

        const Node *ancestor(const Node *origin, const Checker &checker, bool mustBeActive = false);

        std::string path(const Node *node, const std::string &separator = "/");

        const Node *root(const Node *of);
        size_t depth(const Node *of);

        const Node *resolve(const Node *origin, const std::string &relative, const std::string &separator = "/");
    }

    namespace search {
        const Node *descendantNamed(
            const Node *origin, const std::string &name, bool mustBeActive, Order order = Order::DepthFirst);
        const Node *descendantTagged(
            const Node *origin, const std::string &tag, bool mustBeActive, Order order = Order::DepthFirst);

        std::vector<const Node *> descendantsNamed(const Node *origin, const std::string &name, bool mustBeActive);
        std::vector<const Node *> descendantsTagged(const Node *origin, const std::string &tag, bool mustBeActive);

        const Node *ancestorNamed(const Node *origin, const std::string &name);
        const Node *ancestorTagged(const Node *origin, const std::string &tag);
    }
}
