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
  // spdlog::level::from_str() maps every unknown name to off
  spdlog::level::level_enum level = spdlog::level::from_str(params.log_level);
  if (level == spdlog::level::off && params.log_level != "off") {
    throw util::CleanException("Unknown log level: \"{}\"", params.log_level);
  }

  const char* pattern = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    bool truncate = !params.append_mode;
    sinks.push_back(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, truncate));
  }
  for (auto& sink : sinks) {
    sink->set_pattern(pattern);
  }

  auto logger = std::make_shared<spdlog::logger>("hexgame", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::debug);
  spdlog::set_default_logger(logger);
}

}  // namespace util
