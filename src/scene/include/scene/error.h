#pragma once

#include <exception>
#include <string>

#include <fmt/format.h>

namespace arbor::scene {
    struct SceneError : public std::exception {
        std::string issue;

        [[nodiscard]] const char *what() const noexcept override;

        explicit SceneError(std::string message);

        template <typename Arg, typename... Args>
        SceneError(fmt::format_string<Arg, Args...> format, Arg &&arg, Args &&...args)
            : SceneError(fmt::format(format, std::forward<Arg>(arg), std::forward<Args>(args)...)) { }
    };

    // Raised when a tag is used that was never registered with the scene.
    struct TagError : public std::exception {
        std::string tag;
        std::string issue;

        [[nodiscard]] const char *what() const noexcept override;

        explicit TagError(std::string tag);
    };
}
