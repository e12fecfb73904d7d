#pragma once

#include <set>
#include <string>
#include <vector>

namespace arbor::scene {
    struct Tags {
        std::set<std::string> names;

        [[nodiscard]] bool contains(const std::string &tag) const;

        // throws TagError if tag was never added
        void verify(const std::string &tag) const;

        void add(const std::string &tag);

        Tags() = default;
        explicit Tags(const std::vector<std::string> &tags);
    };
}
