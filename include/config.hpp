#ifndef FORTS_CONFIG_HPP
#define FORTS_CONFIG_HPP

// ------------------------------------------------------------------
// Headers: logging and serialization
// ------------------------------------------------------------------
#include "spdlog/spdlog.h"                       // spdlog core
#include "spdlog/sinks/stdout_color_sinks.h"     // colored console sink
#include "spdlog/sinks/basic_file_sink.h"        // file sink
#include "spdlog/async.h"                        // async logger

#include <cereal/archives/json.hpp>              // JSON config archives
#include <cereal/types/string.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

// ------------------------------------------------------------------
// General constants
// ------------------------------------------------------------------
#define FORTS_VERSION "1.0.0"                    // library version
#define FORTS_LOGGER_NAME "logger"               // default logger name
#define FORTS_LOGGER_FILE "ForTS.log"            // log file inside log_dir

// ------------------------------------------------------------------
// Type aliases
// ------------------------------------------------------------------
using FilePath = std::filesystem::path;         // file path

namespace ForTS {

// ------------------------------------------------------------------
// Tree sequence types (positions and times are integral)
// ------------------------------------------------------------------
using Position = std::int64_t;                  // genome coordinate
using Time = std::int64_t;                      // birth time, counted forwards
using IdType = std::int32_t;                    // node id / row index
using Deme = std::int32_t;                      // subpopulation label

inline constexpr IdType NULL_ID = -1;           // "no node"
inline constexpr Position MAX_POSITION = std::numeric_limits<Position>::max();

// ------------------------------------------------------------------
// Exceptions
// ------------------------------------------------------------------

// Root of every error raised by this library
class ForTSException : public std::runtime_error {
public:
    explicit ForTSException(const std::string& message) : std::runtime_error("ForTS: " + message) {}
};

class IOException : public ForTSException {
public:
    explicit IOException(const std::string& message) : ForTSException("IO error: " + message) {}
};

// ------------------------------------------------------------------
// Simplification flags (bit set)
// ------------------------------------------------------------------
enum class SimplificationFlags : std::uint32_t {
    NONE = 0,                                   // no checks
    VALIDATE_EDGES = 1u << 0,                   // row and sort-order checks on the edge table
    VALIDATE_ALL = VALIDATE_EDGES,              // every check above
};

inline constexpr SimplificationFlags operator|(SimplificationFlags a, SimplificationFlags b) {
    return static_cast<SimplificationFlags>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline constexpr SimplificationFlags operator&(SimplificationFlags a, SimplificationFlags b) {
    return static_cast<SimplificationFlags>(static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
}

inline constexpr bool contains(SimplificationFlags flags, SimplificationFlags query) {
    return (flags & query) == query && query != SimplificationFlags::NONE;
}

} // namespace ForTS

// Runtime options for a simplifier (serializable)
struct SimplifierArgs {
    std::uint32_t flags = 0;                    // SimplificationFlags bits
    std::string log_level = "info";             // spdlog level name
    FilePath log_dir = "";                      // empty: console only

    ForTS::SimplificationFlags toFlags() const {
        return static_cast<ForTS::SimplificationFlags>(flags);
    }

    // Returns false if log_level is not a spdlog level name
    bool applyLogLevel() const;

    // Install a console + file logger writing log_dir/ForTS.log.
    // Returns false (logger unchanged) if log_dir is empty or cannot be created.
    bool applyLogDir() const;

    template<class Archive>
    void serialize(Archive& ar) {
        ar(
            CEREAL_NVP(flags),
            CEREAL_NVP(log_level),
            CEREAL_NVP(log_dir)
        );
    }
};

namespace cereal {

    template <class Archive>
    void save(Archive& ar, const std::filesystem::path& p)
    {
        std::string path_str = p.string();
        ar(path_str);
    }

    template <class Archive>
    void load(Archive& ar, std::filesystem::path& p)
    {
        std::string path_str;
        ar(path_str);
        p = std::filesystem::path(path_str);
    }

} // namespace cereal

bool saveSimplifierArgs(const SimplifierArgs& args, const FilePath& filename);
bool loadSimplifierArgs(SimplifierArgs& args, const FilePath& filename);

// Setup logger with optional file output
inline void setupLoggerWithFile(std::filesystem::path log_dir) {
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	console_sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");

	std::filesystem::path log_file = log_dir / FORTS_LOGGER_FILE;
	auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
	file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

	spdlog::sinks_init_list sinks = { console_sink, file_sink };
	auto logger = std::make_shared<spdlog::async_logger>(
		FORTS_LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(), spdlog::async_overflow_policy::block);

	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::trace);
	spdlog::flush_every(std::chrono::seconds(3));
}

// Setup console-only logger
inline void setupLogger() {
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	console_sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");

	spdlog::sinks_init_list sinks = { console_sink };
	auto logger = std::make_shared<spdlog::async_logger>(
		FORTS_LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(), spdlog::async_overflow_policy::block);

	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::trace);
	spdlog::flush_every(std::chrono::seconds(3));
}

#endif // FORTS_CONFIG_HPP
