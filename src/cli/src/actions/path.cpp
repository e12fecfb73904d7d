#include <cli/cli.h>

#include <scene/scene.h>

#include <hierarchy/search.h>

#include <fmt/format.h>

namespace arbor::cli {
    void CLIPathOptions::execute() {
        auto scene = scene::Scene::loadFromThrows(sceneFile);
        auto object = scene.findThrows(nodePath);

        fmt::print("{}\n", hierarchy::search::path(object, separator));
    }
}
