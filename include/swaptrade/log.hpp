#ifndef SWAPTRADE_LOG_HPP
#define SWAPTRADE_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace swaptrade {

// Shared `swaptrade` logger (stderr, colour). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts trace|debug|info|warn|error|critical|off; false leaves the
// level unchanged
bool set_log_level(std::string_view level);

} // namespace swaptrade

#endif // SWAPTRADE_LOG_HPP
