#pragma once

#include <hierarchy/search.h>

#include <string>
#include <exception>

namespace CLI {
    class App;
}

namespace arbor::options {
    struct OptionsError : std::exception {
        std::string reason;

        [[nodiscard]] const char *what() const noexcept override;

        explicit OptionsError(std::string reason);
    };

    struct SearchOptions {
        std::string name;
        std::string tag;

        bool mustBeActive = false;
        bool breadthFirst = false;

        // exactly one of name or tag
        [[nodiscard]] hierarchy::search::Checker checker() const;
        [[nodiscard]] hierarchy::search::Order order() const;

        // used in log lines, "name Square5" or "tag Circle"
        [[nodiscard]] std::string describe() const;

        void connect(CLI::App &app, bool withOrder = true);

        bool operator==(const SearchOptions &other) const;
        bool operator!=(const SearchOptions &other) const;

        SearchOptions() = default;
        SearchOptions(int count, const char **args);
    };
}
