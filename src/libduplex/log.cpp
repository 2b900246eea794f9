#include <duplex/error.h>
#include <duplex/log.h>

#include <cstdlib>
#include <timber/timber>

namespace duplex {
    auto configure_logging() -> void {
        timber::log_handler = &timber::console_logger;
        timber::reporting_level = timber::level::info;

        const auto* const value = std::getenv(log_level_variable.data());
        if (!value || !*value) return;

        const auto level = timber::parse_level(value);
        if (!level) {
            throw config_error(
                "{}: unknown log level '{}'",
                log_level_variable,
                value
            );
        }

        timber::reporting_level = *level;
    }
}
