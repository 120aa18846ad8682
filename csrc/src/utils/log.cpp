// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file log.cpp
 * @brief Verbosity control for the spdlog-backed logging facade.
 */

#include <qcloud/utils/log.hpp>

#include <spdlog/common.h>

#include <stdexcept>

namespace qcloud::log {

void set_level(const std::string& level) {
    const auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only accept that when asked for
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("log::set_level: unknown level '" + level + "'");
    }
    spdlog::set_level(lvl);
}

std::string get_level() {
    const auto name = spdlog::level::to_string_view(spdlog::get_level());
    return {name.data(), name.size()};
}

} // namespace qcloud::log
