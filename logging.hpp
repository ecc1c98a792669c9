#pragma once

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace introspect
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/**
 * @brief Returns the logger registered under name
 *
 * The first call for a name clones the default logger, so sinks and levels
 * configured on the default logger (e.g. via SPDLOG_LEVEL) are inherited.
 */
inline LoggerPtr getLogger(std::string const& name)
{
    if (auto logger = spdlog::get(name))
        return logger;

    auto logger = spdlog::default_logger()->clone(name);

    // another thread may have won the race, in which case we keep its logger
    try
    {
        spdlog::register_logger(logger);
    }
    catch (spdlog::spdlog_ex const&)
    {
        if (auto existing = spdlog::get(name))
            return existing;
    }

    return logger;
}
} // namespace introspect
