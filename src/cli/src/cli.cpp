#include <cli/cli.h>

#include <cli/log.h>

#include <hierarchy/search.h>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

namespace arbor::cli {
    void CLIHook::attach(CLI::App *newApp) {
        this->app = newApp;

        connect();

        app->parse_complete_callback([this]() { execute(); });
    }

    void CLISceneHook::connectScene() {
        app->add_option("node", nodePath, "Absolute path of the object to start from.")->required();
        app->add_option("-s,--scene", sceneFile, "Scene file to use.");
    }

    void CLIFindOptions::connect() {
        connectScene();
        search.connect(*app);
    }

    void CLIFindAllOptions::connect() {
        connectScene();
        search.connect(*app, false);
    }

    void CLIAncestorOptions::connect() {
        connectScene();
        search.connect(*app, false);
    }

    void CLIPathOptions::connect() {
        connectScene();
        app->add_option("--separator", separator, "String placed between object names.");
    }

    void CLIReportOptions::connect() {
        connectScene();

        app->add_option("-n,--name", name, "Name to look for above and below the object.")->required();
        app->add_option("-t,--tag", tag, "Tag to look for above and below the object.")->required();
        app->add_option("--all-tag", allTag, "Tag to collect from every active descendant, defaults to --tag.");
    }

    void CLITreeOptions::connect() { app->add_option("-s,--scene", sceneFile, "Scene file to use."); }

    std::string describe(const hierarchy::Node *node) {
        if (!node)
            return "<none>";

        return hierarchy::search::path(node);
    }

    CLIOptions::CLIOptions(int count, const char **args) {
        CLI::App app("Arbor Hierarchy Search");

        app.require_subcommand(1);

        auto hook = [&app](CLIHook &hook, const char *name, const char *description) {
            hook.attach(app.add_subcommand(name, description));
        };

        hook(find, "find", "Find the first descendant matching a name or tag.");
        hook(findAll, "find-all", "Find every descendant matching a name or tag.");
        hook(ancestor, "ancestor", "Find the closest ancestor matching a name or tag.");
        hook(path, "path", "Print the full path of an object.");
        hook(report, "report", "Run every kind of search from one object.");
        hook(tree, "tree", "Print every object in a scene.");

        try {
            app.parse(count, args);
        } catch (const CLI::Error &e) {
            status = app.exit(e);
        } catch (const std::exception &e) {
            log(LogSource::error, "{}", e.what());
            status = 1;
        }
    }
}
