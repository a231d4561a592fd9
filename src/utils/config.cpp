#include "config.hpp"

#include <fstream>
#include <system_error>

bool SimplifierArgs::applyLogLevel() const {
	auto level = spdlog::level::from_str(log_level);
	// from_str maps unknown names to "off"
	if (level == spdlog::level::off && log_level != "off") {
		spdlog::warn("[applyLogLevel] Unknown log level '{}', keeping current level", log_level);
		return false;
	}
	spdlog::set_level(level);
	return true;
}

bool SimplifierArgs::applyLogDir() const {
	if (log_dir.empty()) {
		return false;
	}
	std::error_code ec;
	std::filesystem::create_directories(log_dir, ec);
	if (ec) {
		spdlog::error("[applyLogDir] Cannot create {}: {}", log_dir.string(), ec.message());
		return false;
	}
	setupLoggerWithFile(log_dir);
	spdlog::info("ForTS {} logging to {}", FORTS_VERSION, (log_dir / FORTS_LOGGER_FILE).string());
	return true;
}

bool saveSimplifierArgs(const SimplifierArgs& args, const FilePath& filename) {
	std::ofstream os(filename);
	if (!os) {
		spdlog::error("Failed to open {} for saving SimplifierArgs", filename.string());
		return false;
	}
	{
		cereal::JSONOutputArchive archive(os);
		archive(cereal::make_nvp("simplifier", args));
	}
	spdlog::info("SimplifierArgs saved to {}", filename.string());
	return static_cast<bool>(os);
}

bool loadSimplifierArgs(SimplifierArgs& args, const FilePath& filename) {
	std::ifstream is(filename);
	if (!is) {
		spdlog::error("Failed to open {} for loading SimplifierArgs", filename.string());
		return false;
	}
	try {
		cereal::JSONInputArchive archive(is);
		archive(cereal::make_nvp("simplifier", args));
	}
	catch (const cereal::Exception& e) {
		spdlog::error("Failed to parse {}: {}", filename.string(), e.what());
		return false;
	}
	spdlog::info("SimplifierArgs loaded from {}", filename.string());
	return true;
}
