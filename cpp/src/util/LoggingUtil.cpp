#include "util/LoggingUtil.hpp"

#include "util/Exception.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  spdlog::level::level_enum level = parse_level(params.log_level);

  // 2024-03-12 17:13:11.259615 [140213] warning Connection 3: malformed message: ...
  const char* format = params.omit_timestamps ? "[%t] %^%-7l%$ %v"
                                              : "%Y-%m-%d %H:%M:%S.%f [%t] %^%-7l%$ %v";

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename,
                                                                         !params.append_mode));
  }

  auto logger = std::make_shared<spdlog::logger>("gomoku", sinks.begin(), sinks.end());
  logger->set_pattern(format);
  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::debug);
  spdlog::set_level(level);
}

spdlog::level::level_enum Logging::parse_level(const std::string& name) {
  spdlog::level::level_enum level = spdlog::level::from_str(name);
  // from_str() maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw util::CleanException("Unknown log level \"{}\"", name);
  }
  return level;
}

}  // namespace util
