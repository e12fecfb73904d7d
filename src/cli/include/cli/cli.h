#pragma once

#include <options/options.h>

#include <string>

namespace CLI {
    class App;
}

namespace arbor::hierarchy {
    struct Node;
}

namespace arbor::cli {
    struct CLIHook {
    protected:
        CLI::App *app = nullptr;

        virtual void execute() = 0;
        virtual void connect() = 0;

    public:
        void attach(CLI::App *app);

        virtual ~CLIHook() = default;
    };

    // Subcommands that start from one object inside a scene file.
    struct CLISceneHook : public CLIHook {
    protected:
        std::string sceneFile = "scene.yaml";
        std::string nodePath;

        void connectScene();
    };

    struct CLIFindOptions : public CLISceneHook {
        options::SearchOptions search;

        void execute() override;
        void connect() override;
    };

    struct CLIFindAllOptions : public CLISceneHook {
        options::SearchOptions search;

        void execute() override;
        void connect() override;
    };

    struct CLIAncestorOptions : public CLISceneHook {
        options::SearchOptions search;

        void execute() override;
        void connect() override;
    };

    struct CLIPathOptions : public CLISceneHook {
        std::string separator = "/";

        void execute() override;
        void connect() override;
    };

    struct CLIReportOptions : public CLISceneHook {
        std::string name;
        std::string tag;
        std::string allTag;

        void execute() override;
        void connect() override;
    };

    struct CLITreeOptions : public CLIHook {
        std::string sceneFile = "scene.yaml";

        void execute() override;
        void connect() override;
    };

    // path of a search result, or a placeholder when there is none
    std::string describe(const hierarchy::Node *node);

    struct CLIOptions {
        CLIFindOptions find;
        CLIFindAllOptions findAll;
        CLIAncestorOptions ancestor;
        CLIPathOptions path;
        CLIReportOptions report;
        CLITreeOptions tree;

        int status = 0;

        CLIOptions(int count, const char **args);
    };
}
