#pragma once

#include <fmt/color.h>
#include <fmt/format.h>

#include <string>

namespace arbor::cli {
    struct LogSource {
        std::string name;
        fmt::text_style header;
        fmt::text_style body;

        static LogSource scene;
        static LogSource search;
        static LogSource match;
        static LogSource error;
    };

    void logHeader(const LogSource &source);

    template <typename... Args>
    void log(const LogSource &source, fmt::format_string<Args...> format, Args &&...args) {
        logHeader(source);

        fmt::print(source.body, fmt::string_view(format), std::forward<Args>(args)...);
        fmt::print("\n");
    }
}
