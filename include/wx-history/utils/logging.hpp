#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace wxhistory::utils {

/**
 * @class Logging
 * @brief The library wide spdlog logger, named "wx-history".
 *
 * Records go to a colored stdout sink. Front ends that keep a log of archive
 * activity attach a file with attachFile(). Sinks are meant to be attached and
 * detached at startup and shutdown, not while other threads log.
 */
class Logging {
public:
	static constexpr const char *kLoggerName = "wx-history";
	static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

	/**
	 * @brief The shared logger, created with the default level on first use.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Sets the level records are emitted and flushed at.
	 *
	 * Reuses a logger registered under kLoggerName by the application, if any.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Appends log records to a file as well.
	 * @return The new sink, for detachSink().
	 * @throws spdlog::spdlog_ex If the file cannot be opened.
	 */
	static spdlog::sink_ptr attachFile(const std::filesystem::path &path);

	static void detachSink(const spdlog::sink_ptr &sink);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace wxhistory::utils

#define WXHISTORY_TRACE(...)    wxhistory::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define WXHISTORY_DEBUG(...)    wxhistory::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define WXHISTORY_INFO(...)     wxhistory::utils::Logging::getLogger()->info(__VA_ARGS__)
#define WXHISTORY_WARN(...)     wxhistory::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define WXHISTORY_ERROR(...)    wxhistory::utils::Logging::getLogger()->error(__VA_ARGS__)
#define WXHISTORY_CRITICAL(...) wxhistory::utils::Logging::getLogger()->critical(__VA_ARGS__)
