#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace codescope {

// Library-wide logger named "codescope". Created on first use against spdlog's default sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

// Replaces the library logger; passing nullptr restores the default.
void SetLogger(std::shared_ptr<spdlog::logger> logger);

}  // namespace codescope
