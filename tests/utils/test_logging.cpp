#include <catch2/catch_test_macros.hpp>

#include "common/temp_directory.hpp"
#include "wx-history/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <string>

using wxhistory::utils::Logging;

namespace {

// Restores the shared logger's level when a test changes it.
class LevelGuard {
public:
	LevelGuard() : level_(Logging::getLogger()->level()), flush_level_(Logging::getLogger()->flush_level()) {}

	~LevelGuard() {
		Logging::getLogger()->set_level(level_);
		Logging::getLogger()->flush_on(flush_level_);
	}

private:
	spdlog::level::level_enum level_;
	spdlog::level::level_enum flush_level_;
};

} // namespace

TEST_CASE("Logging shares one registered wx-history logger", "[utils][logging]") {
	LevelGuard guard;
	const auto *before = Logging::getLogger().get();

	Logging::init(spdlog::level::warn);
	const auto &logger = Logging::getLogger();
	REQUIRE(logger.get() == before);
	REQUIRE(logger->name() == Logging::kLoggerName);
	REQUIRE(spdlog::get(Logging::kLoggerName).get() == before);
	REQUIRE(logger->level() == spdlog::level::warn);
	REQUIRE(logger->flush_level() == spdlog::level::warn);
	REQUIRE_FALSE(logger->should_log(spdlog::level::info));
}

TEST_CASE("Logging writes archive activity to an attached file", "[utils][logging]") {
	LevelGuard guard;
	tests::fixtures::TempDirectory dir;
	const auto path = dir / "history.log";

	Logging::init(spdlog::level::info);
	const auto sinks_before = Logging::getLogger()->sinks().size();
	const auto sink = Logging::attachFile(path);
	REQUIRE(Logging::getLogger()->sinks().size() == sinks_before + 1);

	WXHISTORY_DEBUG("below the level {}", 1);
	WXHISTORY_INFO("Committed {} entries to '{}'", 3, "mesa.zip");
	WXHISTORY_WARN("Found stale backup");
	Logging::getLogger()->flush();

	Logging::detachSink(sink);
	REQUIRE(Logging::getLogger()->sinks().size() == sinks_before);
	WXHISTORY_WARN("after detaching");
	sink->flush();

	const auto text = tests::fixtures::readFile(path);
	REQUIRE(text.find("[wx-history] [info] Committed 3 entries to 'mesa.zip'") != std::string::npos);
	REQUIRE(text.find("[warning] Found stale backup") != std::string::npos);
	REQUIRE(text.find("below the level") == std::string::npos);
	REQUIRE(text.find("after detaching") == std::string::npos);
}
