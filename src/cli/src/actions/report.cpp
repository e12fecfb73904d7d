#include <cli/cli.h>

#include <cli/log.h>

#include <scene/scene.h>

#include <hierarchy/search.h>

namespace arbor::cli {
    void CLIReportOptions::execute() {
        using hierarchy::search::Order;

        auto scene = scene::Scene::loadFromThrows(sceneFile);
        auto origin = scene.findThrows(nodePath);

        log(LogSource::scene, "Report for {}", hierarchy::search::path(origin));

        auto line = [](const char *label, const hierarchy::Node *node) {
            if (node)
                log(LogSource::match, "{}: {}", label, describe(node));
            else
                log(LogSource::search, "{}: {}", label, describe(node));
        };

        line("parent named", hierarchy::search::ancestorNamed(origin, name));
        line("parent tagged", hierarchy::search::ancestorTagged(origin, tag));

        line("child named, depth first", hierarchy::search::descendantNamed(origin, name, true));
        line("child named, breadth first", hierarchy::search::descendantNamed(origin, name, true, Order::BreadthFirst));

        line("child tagged, depth first", hierarchy::search::descendantTagged(origin, tag, true));
        line("child tagged, breadth first", hierarchy::search::descendantTagged(origin, tag, true, Order::BreadthFirst));

        auto collected = allTag.empty() ? tag : allTag;

        for (auto node : hierarchy::search::descendantsTagged(origin, collected, true))
            line("active child tagged", node);
    }
}
