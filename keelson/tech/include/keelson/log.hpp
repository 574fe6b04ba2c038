#pragma once

// All keelson code logs through spdlog, aliased as keelson::log so call sites read log::info("...", args).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace keelson {

namespace log = spdlog;

}  // namespace keelson
