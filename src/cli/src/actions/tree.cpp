#include <cli/cli.h>

#include <cli/log.h>

#include <scene/scene.h>

#include <fmt/format.h>

#include <string>

namespace arbor::cli {
    namespace {
        void printObject(const scene::Object *object, size_t indent) {
            std::string tags;

            for (const auto &tag : object->tags())
                tags += fmt::format(" #{}", tag);

            fmt::print("{:{}}{}{}{}\n", "", indent * 2, object->name(), object->isActive() ? "" : " (inactive)", tags);

            for (const auto &child : object->children())
                printObject(child.get(), indent + 1);
        }
    }

    void CLITreeOptions::execute() {
        auto scene = scene::Scene::loadFromThrows(sceneFile);

        log(LogSource::scene, "{} tag(s) registered", scene.tags->names.size());

        printObject(scene.root.get(), 0);
    }
}
