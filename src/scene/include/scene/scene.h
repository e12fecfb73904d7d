#pragma once

#include <scene/tags.h>
#include <scene/object.h>

#include <memory>
#include <string>
#include <optional>

namespace YAML {
    class Node;
}

namespace arbor::scene {
    struct Scene {
        std::shared_ptr<Tags> tags;
        std::unique_ptr<Object> root;

        // absolute path starting with the root name, like /Root/A/B
        [[nodiscard]] const Object *find(const std::string &path) const;
        [[nodiscard]] const Object *findThrows(const std::string &path) const;

        static std::optional<Scene> loadFrom(const std::string &path);
        static Scene loadFromThrows(const std::string &path);

        Scene(std::shared_ptr<Tags> tags, std::string rootName);
        explicit Scene(const YAML::Node &node);
    };
}
