#include <scene/scene.h>

#include <scene/error.h>

#include <hierarchy/search.h>

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>
#include <filesystem>

namespace fs = std::filesystem;

namespace arbor::scene {
    namespace {
        std::vector<std::string> readNames(const YAML::Node &node, const std::string &owner) {
            if (!node.IsSequence())
                throw SceneError("Tags of {} must be a list.", owner);

            std::vector<std::string> result;

            for (const auto &entry : node) {
                if (!entry.IsScalar())
                    throw SceneError("Tags of {} must be plain names.", owner);

                result.push_back(entry.Scalar());
            }

            return result;
        }

        std::string readName(const YAML::Node &node, const std::string &owner) {
            if (!node.IsMap())
                throw SceneError("Child of {} must be a map.", owner);

            auto name = node["name"];
            if (!name)
                throw SceneError("Child of {} is missing a name.", owner);

            if (!name.IsScalar())
                throw SceneError("Name of a child of {} must be a string.", owner);

            return name.Scalar();
        }

        void readObject(Object *object, const YAML::Node &node) {
            if (auto value = node["active"]) {
                bool active = true;

                if (!value.IsScalar() || !YAML::convert<bool>::decode(value, active))
                    throw SceneError("Active flag of {} must be true or false.", object->name());

                object->setActive(active);
            }

            if (auto value = node["tags"]) {
                for (const auto &tag : readNames(value, object->name()))
                    object->addTag(tag);
            }

            if (auto value = node["children"]) {
                if (!value.IsSequence())
                    throw SceneError("Children of {} must be a list.", object->name());

                for (const auto &decl : value)
                    readObject(object->create(readName(decl, object->name())), decl);
            }
        }
    }

    const Object *Scene::find(const std::string &path) const {
        auto start = path.find_first_not_of('/');
        if (start == std::string::npos)
            return nullptr;

        auto end = path.find('/', start);
        auto first = path.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (first != root->name())
            return nullptr;

        if (end == std::string::npos)
            return root.get();

        // every node below root is an Object
        return static_cast<const Object *>(hierarchy::search::resolve(root.get(), path.substr(end)));
    }

    const Object *Scene::findThrows(const std::string &path) const {
        auto object = find(path);

        if (!object)
            throw std::runtime_error(fmt::format("Cannot find object at {}.", path));

        return object;
    }

    std::optional<Scene> Scene::loadFrom(const std::string &path) {
        std::ifstream stream(path);

        if (!stream.is_open())
            return std::nullopt;

        return Scene(YAML::Load(stream));
    }

    Scene Scene::loadFromThrows(const std::string &path) {
        auto scene = loadFrom(path);

        if (!scene) {
            auto absolute = fs::absolute(fs::path(path)).string();

            throw std::runtime_error(fmt::format("Cannot find scene file at {}.", absolute));
        }

        return std::move(*scene);
    }

    Scene::Scene(std::shared_ptr<Tags> tags, std::string rootName)
        : tags(std::move(tags)) {
        if (!this->tags)
            this->tags = std::make_shared<Tags>();

        root = std::make_unique<Object>(this->tags, std::move(rootName));
    }

    Scene::Scene(const YAML::Node &node)
        : tags(std::make_shared<Tags>()) {
        if (!node.IsMap())
            throw SceneError("Scene description must be a map.");

        if (auto value = node["tags"])
            *tags = Tags(readNames(value, "scene"));

        auto rootNode = node["root"];
        if (!rootNode)
            throw SceneError("Scene is missing a root object.");

        if (!rootNode.IsMap())
            throw SceneError("Root object must be a map.");

        auto name = rootNode["name"];
        if (!name)
            throw SceneError("Root object is missing a name.");

        if (!name.IsScalar())
            throw SceneError("Root object name must be a string.");

        root = std::make_unique<Object>(tags, name.Scalar());

        readObject(root.get(), rootNode);
    }
}
