#include <awsid/util/logger.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace awsid {
namespace {
std::string make_timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	auto tm = std::tm{};
	char buffer[16]{};
	if (!localtime_r(&now, &tm) || !std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm)) { return {}; }
	return buffer;
}

struct ThreadIds {
	std::unordered_map<std::thread::id, int> ids{};
	std::mutex mutex{};

	int get() {
		auto lock = std::scoped_lock{mutex};
		auto const [it, _] = ids.try_emplace(std::this_thread::get_id(), static_cast<int>(ids.size()));
		return it->second;
	}
};

struct Buffer {
	std::size_t limit{500};
	std::size_t extra{100};
	std::vector<logger::Entry> entries{};
	std::mutex mutex{};

	void push(logger::Entry entry) {
		auto lock = std::scoped_lock{mutex};
		entries.push_back(std::move(entry));
		if (entries.size() <= limit + extra) { return; }
		entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(entries.size() - limit));
	}
};

ThreadIds g_thread_ids{};
Buffer g_buffer{};
} // namespace

int logger::thread_id() { return g_thread_ids.get(); }

std::string logger::format(Level level, std::string_view const message) {
	auto const level_char = levels_v[static_cast<std::size_t>(level)];
	try {
		return fmt::format(fmt::runtime(g_format), fmt::arg("thread", thread_id()), fmt::arg("level", level_char), fmt::arg("message", message),
						   fmt::arg("timestamp", make_timestamp()));
	} catch (fmt::format_error const&) { return fmt::format("[{}] {}", level_char, message); }
}

void logger::write(Entry entry) {
	std::fprintf(stderr, "%s\n", entry.message.c_str());
	g_buffer.push(std::move(entry));
}

void logger::access_buffer(Accessor& accessor) {
	auto lock = std::scoped_lock{g_buffer.mutex};
	accessor(g_buffer.entries);
}

logger::Instance::Instance(std::size_t buffer_limit, std::size_t buffer_extra) {
	auto lock = std::scoped_lock{g_buffer.mutex};
	g_buffer.limit = buffer_limit;
	g_buffer.extra = buffer_extra;
	g_buffer.entries.clear();
}

logger::Instance::~Instance() {
	auto lock = std::scoped_lock{g_buffer.mutex};
	g_buffer.entries.clear();
}
} // namespace awsid
