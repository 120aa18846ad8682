// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file log.hpp
 * @brief Logging facade over spdlog.
 *
 * All library diagnostics go through the qcloud::log namespace so that
 * callers (C++ or the Python bridge) control verbosity in one place.
 * Sampling hot paths log at debug only; the default spdlog level hides them.
 *
 * Date: October, 2026
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace qcloud::log {

using spdlog::critical;
using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::trace;
using spdlog::warn;

/**
 * Set global verbosity.
 * @param level One of "trace", "debug", "info", "warn", "error",
 *              "critical", "off"
 * @throws std::invalid_argument Unknown level name
 */
void set_level(const std::string& level);

/// Current verbosity as spdlog name
[[nodiscard]] std::string get_level();

} // namespace qcloud::log
