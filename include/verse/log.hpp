#pragma once


/*
    -------------
    Verse logging
    -------------
    Verse writes its diagnostics through a single spdlog logger named
    "verse". It is created lazily with a colored stderr sink and a default
    level of `warn`, so a quiet application sees nothing unless it lowers
    the level:

        Verse::set_log_level(spdlog::level::debug);  // conversion failures
        Verse::set_log_level(spdlog::level::trace);  // records and maps entered

    An application that registers its own logger named "verse" before the
    first Verse call gets its logger used instead.
*/

#include <memory>

#include <spdlog/spdlog.h>

#include "verse/config.hpp"

namespace Verse {

    /// @brief Returns the library logger, creating it on first use
    [[nodiscard]] VERSE_API const std::shared_ptr<spdlog::logger>& logger();

    /// @brief Sets the level of the library logger
    VERSE_API void set_log_level(spdlog::level::level_enum level);

} // namespace Verse
