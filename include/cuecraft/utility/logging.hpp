// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#ifdef CUECRAFT_DEBUG

#define START_SLOW_WATCHER() spdlog::stopwatch _sw;

// warn above 100ms, error above 500ms
#define CHECK_SLOW_WATCHER()                                                                   \
    if (_sw.elapsed().count() > 0.5)                                                           \
        spdlog::error("{}@{} slow {:.3f}s", __PRETTY_FUNCTION__, __LINE__, _sw);               \
    else if (_sw.elapsed().count() > 0.1)                                                      \
        spdlog::warn("{}@{} slow {:.3f}s", __PRETTY_FUNCTION__, __LINE__, _sw);

#else

#define START_SLOW_WATCHER()                                                                   \
    {}
#define CHECK_SLOW_WATCHER()                                                                   \
    {}

#endif

namespace cuecraft {
namespace utility {

    //! Logger identity and logfile rotation, see global_store::log_settings.
    struct LogSettings {
        std::string name{"cuecraft"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
        size_t max_file_size{10 * 1024 * 1024};
        size_t max_files{3};
    };

    /*! Install the default logger.
        Console output is filtered at lvl, the optional rotating logfile
        records everything from debug up.
    */
    void start_logger(
        const spdlog::level::level_enum lvl = spdlog::level::info,
        const std::string &logfile          = "",
        const LogSettings &settings         = LogSettings());

    //! Flush and announce shutdown.
    void stop_logger();

} // namespace utility
} // namespace cuecraft
