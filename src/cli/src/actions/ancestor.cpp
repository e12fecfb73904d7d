#include <cli/cli.h>

#include <cli/log.h>

#include <scene/scene.h>

#include <hierarchy/search.h>

namespace arbor::cli {
    void CLIAncestorOptions::execute() {
        auto scene = scene::Scene::loadFromThrows(sceneFile);
        auto origin = scene.findThrows(nodePath);

        auto checker = search.checker();

        log(LogSource::search, "Looking above {} for {}", nodePath, search.describe());

        auto result = hierarchy::search::ancestor(origin, checker, search.mustBeActive);

        if (result)
            log(LogSource::match, "{}", describe(result));
        else
            log(LogSource::search, "No match");
    }
}
