#include "wx-history/utils/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>

namespace wxhistory::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get(kLoggerName);
	}
	if (!logger_) {
		logger_ = spdlog::stdout_color_mt(kLoggerName);
		logger_->set_pattern(kPattern);
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

spdlog::sink_ptr Logging::attachFile(const std::filesystem::path &path) {
	auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
	sink->set_pattern(kPattern);
	getLogger()->sinks().push_back(sink);
	return sink;
}

void Logging::detachSink(const spdlog::sink_ptr &sink) {
	auto &sinks = getLogger()->sinks();
	sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

} // namespace wxhistory::utils
