#ifndef INCLUDE_CODERUN_LOGGER_H_
#define INCLUDE_CODERUN_LOGGER_H_

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

// Colored stdout logger; the returned logger is handed to every component
//  instead of using the global default logger
std::shared_ptr<spdlog::logger> CreateLogger(
    const std::string& name, spdlog::level::level_enum level = spdlog::level::warn);

// Keep console sinks usable in children created by fork()
void InitLogger();

#endif  // INCLUDE_CODERUN_LOGGER_H_
