/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dcbor::common {
  Logger createLogger(const std::string &tag) {
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    try {
      return spdlog::stderr_color_mt(tag);
    } catch (const spdlog::spdlog_ex &) {
      // registered concurrently by another thread
      return spdlog::get(tag);
    }
  }
}  // namespace dcbor::common
