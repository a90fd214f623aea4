// SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cuecraft/utility/logging.hpp"

using namespace cuecraft::utility;

void cuecraft::utility::start_logger(
    const spdlog::level::level_enum lvl, const std::string &logfile, const LogSettings &settings) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(lvl);
    sinks.push_back(console);

    if (not logfile.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logfile, settings.max_file_size, settings.max_files);
        file->set_level(spdlog::level::debug);
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>(settings.name, sinks.begin(), sinks.end());
    // the logger itself passes debug so the file sink sees it, sinks filter further
    logger->set_level(lvl < spdlog::level::debug ? lvl : spdlog::level::debug);
    logger->set_pattern(settings.pattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::debug(
        "Logger {} started, console at {}{}",
        settings.name,
        spdlog::level::to_string_view(lvl),
        logfile.empty() ? std::string() : ", file " + logfile);
}

void cuecraft::utility::stop_logger() {
    auto logger = spdlog::default_logger();
    spdlog::debug("Logger {} stopped", logger->name());
    logger->flush();
}
