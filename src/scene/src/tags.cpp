#include <scene/tags.h>

#include <scene/error.h>

namespace arbor::scene {
    bool Tags::contains(const std::string &tag) const {
        return names.find(tag) != names.end();
    }

    void Tags::verify(const std::string &tag) const {
        if (!contains(tag))
            throw TagError(tag);
    }

    void Tags::add(const std::string &tag) {
        if (tag.empty())
            throw SceneError("Tag names cannot be empty.");

        names.insert(tag);
    }

    Tags::Tags(const std::vector<std::string> &tags) {
        for (const auto &tag : tags)
            add(tag);
    }
}
