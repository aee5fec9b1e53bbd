#include "verse/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Verse {

    const std::shared_ptr<spdlog::logger>& logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get("verse")) return existing;
            auto created = spdlog::stderr_color_mt("verse");
            created->set_level(spdlog::level::warn);
            return created;
        }();
        return instance;
    }

    void set_log_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

} // namespace Verse
