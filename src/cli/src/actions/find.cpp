#include <cli/cli.h>

#include <cli/log.h>

#include <scene/scene.h>

#include <hierarchy/search.h>

namespace arbor::cli {
    void CLIFindOptions::execute() {
        auto scene = scene::Scene::loadFromThrows(sceneFile);
        auto origin = scene.findThrows(nodePath);

        auto checker = search.checker();

        log(LogSource::search, "Looking below {} for {} ({})", nodePath, search.describe(),
            search.breadthFirst ? "breadth first" : "depth first");

        auto result = hierarchy::search::descendant(origin, checker, search.mustBeActive, search.order());

        if (result)
            log(LogSource::match, "{}", describe(result));
        else
            log(LogSource::search, "No match");
    }

    void CLIFindAllOptions::execute() {
        auto scene = scene::Scene::loadFromThrows(sceneFile);
        auto origin = scene.findThrows(nodePath);

        auto checker = search.checker();

        log(LogSource::search, "Collecting below {} for {}", nodePath, search.describe());

        auto results = hierarchy::search::descendants(origin, checker, search.mustBeActive);

        for (auto result : results)
            log(LogSource::match, "{}", describe(result));

        log(LogSource::search, "{} match(es)", results.size());
    }
}
