// src/log.hpp
// Library logger: spdlog logger named "atlantis".

#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace atlantis {

// Reuses a logger the host registered under "atlantis", otherwise creates
// a stderr colour logger on first use.
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("atlantis")) return existing;
        return spdlog::stderr_color_mt("atlantis");
    }();
    return instance;
}

} // namespace atlantis
