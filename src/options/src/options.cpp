#include <options/options.h>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <fmt/format.h>

namespace arbor::options {
    const char *OptionsError::what() const noexcept { return reason.c_str(); }

    OptionsError::OptionsError(std::string reason)
        : reason(std::move(reason)) { }

    hierarchy::search::Checker SearchOptions::checker() const {
        if (!name.empty() && !tag.empty())
            throw OptionsError("Only one of --name or --tag may be given.");

        if (!name.empty())
            return hierarchy::search::named(name);

        if (!tag.empty())
            return hierarchy::search::tagged(tag);

        throw OptionsError("One of --name or --tag is required.");
    }

    hierarchy::search::Order SearchOptions::order() const {
        return breadthFirst ? hierarchy::search::Order::BreadthFirst : hierarchy::search::Order::DepthFirst;
    }

    std::string SearchOptions::describe() const {
        if (!name.empty())
            return fmt::format("name {}", name);

        return fmt::format("tag {}", tag);
    }

    void SearchOptions::connect(CLI::App &app, bool withOrder) {
        auto nameOption = app.add_option("-n,--name", name, "Match objects with this name.");
        app.add_option("-t,--tag", tag, "Match objects carrying this tag.")->excludes(nameOption);

        app.add_flag("-a,--active", mustBeActive, "Only match active objects.");

        if (withOrder)
            app.add_flag("-b,--breadth-first", breadthFirst, "Prefer the shallowest match over pre-order.");
    }

    bool SearchOptions::operator==(const SearchOptions &other) const {
        return name == other.name
            && tag == other.tag
            && mustBeActive == other.mustBeActive
            && breadthFirst == other.breadthFirst;
    }

    bool SearchOptions::operator!=(const SearchOptions &other) const {
        return !operator==(other);
    }

    SearchOptions::SearchOptions(int count, const char **args) {
        CLI::App app("Arbor Search");

        connect(app);

        try {
            app.parse(count, args);
        } catch (const CLI::Error &e) {
            throw OptionsError(e.get_name());
        }
    }
}
