#include <scene/error.h>

namespace arbor::scene {
    const char *SceneError::what() const noexcept {
        return issue.c_str();
    }

    SceneError::SceneError(std::string message)
        : issue(std::move(message)) { }

    const char *TagError::what() const noexcept {
        return issue.c_str();
    }

    TagError::TagError(std::string tag)
        : tag(std::move(tag)), issue(fmt::format("Tag \"{}\" is not defined.", this->tag)) { }
}
