#pragma once

#include <hierarchy/node.h>

#include <scene/tags.h>

#include <set>
#include <memory>
#include <string>
#include <vector>

namespace arbor::scene {
    struct Object : public hierarchy::Node {
        [[nodiscard]] size_t childCount() const override;
        [[nodiscard]] const hierarchy::Node *child(size_t index) const override;
        [[nodiscard]] const hierarchy::Node *parent() const override;
        [[nodiscard]] std::string name() const override;
        [[nodiscard]] bool isActive() const override;
        [[nodiscard]] bool hasTag(const std::string &tag) const override;

        [[nodiscard]] Object *owner() const { return parentObject; }
        [[nodiscard]] const std::vector<std::unique_ptr<Object>> &children() const { return childObjects; }
        [[nodiscard]] const std::set<std::string> &tags() const { return tagNames; }

        Object *add(std::unique_ptr<Object> object);
        Object *create(std::string name);

        // takes this object out of its parent and appends it to the children of target
        void moveTo(Object *target);

        void rename(std::string value);
        void setActive(bool value);
        void addTag(const std::string &tag);
        void removeTag(const std::string &tag);

        Object(std::shared_ptr<const Tags> registry, std::string name);

    private:
        std::shared_ptr<const Tags> registry;

        std::string objectName;
        bool active = true;
        std::set<std::string> tagNames;

        Object *parentObject = nullptr;
        std::vector<std::unique_ptr<Object>> childObjects;
    };
}
