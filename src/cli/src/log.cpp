#include <cli/log.h>

namespace arbor::cli {
    LogSource LogSource::scene = {
        "SCN", fmt::fg(fmt::color::peach_puff)
    };
    LogSource LogSource::search = {
        "FIND", fmt::fg(fmt::color::yellow_green), fmt::fg(fmt::color::teal)
    };
    LogSource LogSource::match = {
        "HIT", fmt::fg(fmt::color::yellow_green), fmt::fg(fmt::color::forest_green) | fmt::emphasis::bold
    };
    LogSource LogSource::error = {
        "ERROR", fmt::fg(fmt::color::orange_red), fmt::fg(fmt::color::orange_red)
    };

    void logHeader(const LogSource &source) {
        fmt::print("[");
        fmt::print(source.header, "{:<4}", source.name);
        fmt::print("] ");
    }
}
