#include "libanoconf/utils/tracing.hpp"
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace libanoconf {
namespace utils {

// Release builds: default to WARN
// Debug builds: default to INFO
#ifdef NDEBUG
static constexpr LogLevel kDefaultLevel = LogLevel::WARN;
#else
static constexpr LogLevel kDefaultLevel = LogLevel::INFO;
#endif

std::atomic<LogLevel> Tracer::current_level_ {kDefaultLevel};

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::once_flag g_tracer_init;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_localtime_mutex;

void Tracer::Initialize() {
	std::call_once(g_tracer_init, [] {
		const char *env_level = std::getenv("ANOCONF_LOG_LEVEL");
		if (env_level != nullptr) {
			current_level_.store(ParseLevel(env_level, kDefaultLevel));
		}
	});
}

void Tracer::SetLogLevel(LogLevel level) {
	// The environment is read first so it never overrides an explicit level
	Initialize();
	current_level_.store(level);
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return current_level_.load();
}

bool Tracer::ShouldLog(LogLevel level) {
	Initialize();
	return level != LogLevel::NONE && level >= current_level_.load();
}

LogLevel Tracer::ParseLevel(const std::string &name, LogLevel fallback) {
	std::string level_str = name;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		return LogLevel::TRACE;
	} else if (level_str == "debug") {
		return LogLevel::DBG;
	} else if (level_str == "info") {
		return LogLevel::INFO;
	} else if (level_str == "warn") {
		return LogLevel::WARN;
	} else if (level_str == "error") {
		return LogLevel::ERR;
	} else if (level_str == "none") {
		return LogLevel::NONE;
	}
	return fallback;
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::ostringstream oss;
	{
		// std::localtime returns shared static storage
		std::lock_guard<std::mutex> lock(g_localtime_mutex);
		oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
	}
	oss << "." << std::setfill('0') << std::setw(3) << ms.count();

	return oss.str();
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::lock_guard<std::mutex> lock(g_tracer_mutex);

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	std::cerr << "[" << timestamp << "] [anoconf/" << level_name << "] " << filename << ":" << line << " - " << message
	          << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::lock_guard<std::mutex> lock(g_tracer_mutex);

	std::cerr << "[" << GetTimestamp() << "] [anoconf/" << GetLevelName(level) << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(
	    std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch())
	        .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	uint64_t end_ns = TimingStart();
	uint64_t duration_ns = end_ns - handle;
	double duration_ms = static_cast<double>(duration_ns) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2);
	oss << operation_name << " completed in " << duration_ms << " ms";

	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace utils
} // namespace libanoconf
