#pragma once
#include <fmt/format.h>
#include <awsid/defines.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace awsid::logger {
enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug, eCOUNT_ };
inline constexpr char levels_v[] = {'E', 'W', 'I', 'D'};

///
/// \brief Line template; supports {thread}, {level}, {message} and {timestamp}.
///
/// A template fmt rejects falls back to "[{level}] {message}".
///
inline std::string g_format{"[T{thread}] [{level}] [awsid] {message} [{timestamp}]"};

struct Entry {
	std::string message{};
	Level level{};
};

struct Accessor {
	virtual void operator()(std::span<Entry const> entries) = 0;
};

int thread_id();
std::string format(Level level, std::string_view const message);
void write(Entry entry);
void access_buffer(Accessor& accessor);

///
/// \brief RAII owner of the in-memory entry buffer.
///
/// Once the buffer holds more than buffer_limit + buffer_extra entries, the oldest are dropped down to buffer_limit.
/// Entries are cleared on destruction.
///
class Instance {
  public:
	Instance(std::size_t buffer_limit = 500, std::size_t buffer_extra = 100);
	~Instance();

	Instance(Instance&&) = delete;
	Instance& operator=(Instance&&) = delete;
	Instance(Instance const&) = delete;
	Instance& operator=(Instance const&) = delete;
};

template <typename... Args>
void log(Level level, fmt::format_string<Args...> fmt, Args const&... args) {
	write({format(level, fmt::vformat(fmt, fmt::make_format_args(args...))), level});
}

template <typename... Args>
void debug(fmt::format_string<Args...> fmt, Args const&... args) {
	if constexpr (debug_v) { log(Level::eDebug, fmt, args...); }
}
} // namespace awsid::logger
