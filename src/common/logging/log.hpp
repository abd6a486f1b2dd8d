#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tid::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

void init();

void shutdown();

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace tid::log
