#include <hierarchy/search.h>

#include <deque>
#include <algorithm>
#include <stdexcept>

namespace arbor::hierarchy {
    namespace search {
        namespace {
            bool qualifies(const Node *node, const Checker &checker, bool mustBeActive) {
                return checker(node) && (!mustBeActive || node->isActive());
            }

            const Node *depthFirst(const Node *origin, const Checker &checker, bool mustBeActive) {
                for (size_t a = 0; a < origin->childCount(); a++) {
                    auto child = origin->child(a);

                    if (qualifies(child, checker, mustBeActive))
                        return child;

                    if (auto grandchild = depthFirst(child, checker, mustBeActive))
                        return grandchild;
                }

                return nullptr;
            }

            const Node *breadthFirst(const Node *origin, const Checker &checker, bool mustBeActive) {
                std::deque<const Node *> queue;

                for (size_t a = 0; a < origin->childCount(); a++)
                    queue.push_back(origin->child(a));

                while (!queue.empty()) {
                    auto node = queue.front();
                    queue.pop_front();

                    if (qualifies(node, checker, mustBeActive))
                        return node;

                    for (size_t a = 0; a < node->childCount(); a++)
                        queue.push_back(node->child(a));
                }

                return nullptr;
            }

            void collect(const Node *origin, const Checker &checker, bool mustBeActive,
                std::vector<const Node *> &result) {
                for (size_t a = 0; a < origin->childCount(); a++) {
                    auto child = origin->child(a);

                    if (qualifies(child, checker, mustBeActive))
                        result.push_back(child);

                    collect(child, checker, mustBeActive, result);
                }
            }
        }

        Checker named(std::string name) {
            return [name = std::move(name)](const Node *node) { return node->name() == name; };
        }

        Checker tagged(std::string tag) {
            return [tag = std::move(tag)](const Node *node) { return node->hasTag(tag); };
        }

        const Node *descendant(const Node *origin, const Checker &checker, bool mustBeActive, Order order) {
            switch (order) {
            case Order::DepthFirst:
                return depthFirst(origin, checker, mustBeActive);
            case Order::BreadthFirst:
                return breadthFirst(origin, checker, mustBeActive);
            default:
                throw std::runtime_error("Unimplemented search order.");
            }
        }

        std::vector<const Node *> descendants(const Node *origin, const Checker &checker, bool mustBeActive) {
            std::vector<const Node *> result;

            collect(origin, checker, mustBeActive, result);

            return result;
        }

        const Node *ancestor(const Node *origin, const Checker &checker, bool mustBeActive) {
            const Node *parent = origin->parent();

            while (parent && !qualifies(parent, checker, mustBeActive)) {
                parent = parent->parent();
            }

            return parent;
        }

        std::string path(const Node *node, const std::string &separator) {
            std::string result = separator + node->name();

            for (auto parent = node->parent(); parent; parent = parent->parent())
                result = separator + parent->name() + result;

            return result;
        }

        const Node *root(const Node *of) {
            while (of && of->parent())
                of = of->parent();

            return of;
        }

        size_t depth(const Node *of) {
            size_t result = 0;

            for (auto parent = of->parent(); parent; parent = parent->parent())
                result++;

            return result;
        }

        const Node *resolve(const Node *origin, const std::string &relative, const std::string &separator) {
            const Node *current = origin;

            size_t start = 0;

            while (current && start <= relative.size()) {
                auto end = separator.empty() ? std::string::npos : relative.find(separator, start);
                if (end == std::string::npos)
                    end = relative.size();

                auto segment = relative.substr(start, end - start);
                start = end + std::max(separator.size(), size_t(1));

                if (segment.empty())
                    continue;

                const Node *next = nullptr;

                for (size_t a = 0; a < current->childCount(); a++) {
                    auto child = current->child(a);

                    if (child->name() == segment) {
                        next = child;
                        break;
                    }
                }

                current = next;
            }

            return current;
        }
    }

    namespace search {
        const Node *descendantNamed(const Node *origin, const std::string &name, bool mustBeActive, Order order) {
            return descendant(origin, named(name), mustBeActive, order);
        }

        const Node *descendantTagged(const Node *origin, const std::string &tag, bool mustBeActive, Order order) {
            return descendant(origin, tagged(tag), mustBeActive, order);
        }

        std::vector<const Node *> descendantsNamed(const Node *origin, const std::string &name, bool mustBeActive) {
            return descendants(origin, named(name), mustBeActive);
        }

        std::vector<const Node *> descendantsTagged(const Node *origin, const std::string &tag, bool mustBeActive) {
            return descendants(origin, tagged(tag), mustBeActive);
        }

        const Node *ancestorNamed(const Node *origin, const std::string &name) {
            return ancestor(origin, named(name));
        }

        const Node *ancestorTagged(const Node *origin, const std::string &tag) {
            return ancestor(origin, tagged(tag));
        }
    }
}
