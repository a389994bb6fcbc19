#include <awsid/util/logger.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace awsid;

namespace {
struct Collect : logger::Accessor {
	std::vector<logger::Entry> entries{};

	void operator()(std::span<logger::Entry const> in) final { entries.assign(in.begin(), in.end()); }
};

std::vector<logger::Entry> snapshot() {
	auto collect = Collect{};
	logger::access_buffer(collect);
	return collect.entries;
}
} // namespace

TEST(logger, format_fields) {
	auto const previous = logger::g_format;
	logger::g_format = "{level}|{message}";
	EXPECT_EQ(logger::format(logger::Level::eWarn, "hello {}", 42), "W|hello 42");
	EXPECT_EQ(logger::format(logger::Level::eError, "x"), "E|x");
	logger::g_format = previous;
}

TEST(logger, malformed_format_falls_back) {
	auto const previous = logger::g_format;
	logger::g_format = "{level} {message";
	EXPECT_EQ(logger::format(logger::Level::eDebug, "kept"), "[D] kept");
	logger::g_format = "{level} {unknown}";
	EXPECT_EQ(logger::format(logger::Level::eWarn, "kept {}", 1), "[W] kept 1");

	auto const instance = logger::Instance{};
	logger::g_format = "{";
	EXPECT_NO_THROW(logger::log(logger::Level::eError, "still logged"));
	logger::g_format = previous;
	auto const entries = snapshot();
	ASSERT_EQ(entries.size(), 1U);
	EXPECT_EQ(entries[0].message, "[E] still logged");
}

TEST(logger, buffer_records_entries) {
	auto const instance = logger::Instance{};
	logger::log(logger::Level::eInfo, "first {}", 1);
	logger::log(logger::Level::eWarn, "second");
	logger::log(logger::Level::eError, "third");

	auto const entries = snapshot();
	ASSERT_EQ(entries.size(), 3U);
	EXPECT_EQ(entries[0].level, logger::Level::eInfo);
	EXPECT_NE(entries[0].message.find("first 1"), std::string::npos);
	EXPECT_EQ(entries[1].level, logger::Level::eWarn);
	EXPECT_EQ(entries[2].level, logger::Level::eError);
}

TEST(logger, buffer_trims_to_limit) {
	auto const instance = logger::Instance{4, 2};
	for (int i = 0; i < 7; ++i) { logger::log(logger::Level::eInfo, "entry {}", i); }

	auto const entries = snapshot();
	ASSERT_EQ(entries.size(), 4U);
	EXPECT_NE(entries.front().message.find("entry 3"), std::string::npos);
	EXPECT_NE(entries.back().message.find("entry 6"), std::string::npos);
}

TEST(logger, instance_clears_on_destruction) {
	{
		auto const instance = logger::Instance{};
		logger::log(logger::Level::eInfo, "transient");
		EXPECT_FALSE(snapshot().empty());
	}
	EXPECT_TRUE(snapshot().empty());
}

TEST(logger, thread_id_is_stable) { EXPECT_EQ(logger::thread_id(), logger::thread_id()); }
