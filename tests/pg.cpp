#include <awsid/id/kinds.hpp>
#include <awsid/pg/params.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace awsid;

namespace {
struct ClearResult {
	void operator()(PGresult* result) const { PQclear(result); }
};

using ResultPtr = std::unique_ptr<PGresult, ClearResult>;

struct Cell {
	std::string text{};
	bool null{};
};

// builds a single-column result without a server connection
ResultPtr make_result(Oid type, std::vector<Cell> cells) {
	auto ret = ResultPtr{PQmakeEmptyPGresult(nullptr, PGRES_TUPLES_OK)};
	if (!ret) { return ret; }
	char name[] = "val";
	auto attribute = PGresAttDesc{};
	attribute.name = name;
	attribute.typid = type;
	attribute.typlen = -1;
	attribute.atttypmod = -1;
	if (!PQsetResultAttrs(ret.get(), 1, &attribute)) { return {}; }
	for (std::size_t row = 0; row < cells.size(); ++row) {
		auto& cell = cells[row];
		auto const length = cell.null ? -1 : static_cast<int>(cell.text.size());
		if (!PQsetvalue(ret.get(), static_cast<int>(row), 0, cell.null ? nullptr : cell.text.data(), length)) { return {}; }
	}
	return ret;
}
} // namespace

TEST(pg, text_compatible_types) {
	EXPECT_TRUE(pg::is_text_compatible(pg::text_oid_v));
	EXPECT_TRUE(pg::is_text_compatible(pg::varchar_oid_v));
	EXPECT_TRUE(pg::is_text_compatible(pg::bpchar_oid_v));
	EXPECT_TRUE(pg::is_text_compatible(pg::name_oid_v));
	EXPECT_TRUE(pg::is_text_compatible(pg::unknown_oid_v));
	EXPECT_FALSE(pg::is_text_compatible(23)); // int4
	EXPECT_FALSE(pg::is_text_compatible(17)); // bytea
}

TEST(pg, params_encode_as_text) {
	auto params = pg::Params{};
	params.add(AwsAmiId::parse("ami-12345678").value()).add(RegionId::eEuCentral1).add(std::optional<AwsVpcId>{});

	ASSERT_EQ(params.size(), 3);
	EXPECT_EQ(params.text_at(0), "ami-12345678");
	EXPECT_EQ(params.text_at(1), "eu-central-1");
	EXPECT_FALSE(params.text_at(2).has_value());
	EXPECT_FALSE(params.text_at(3).has_value());

	auto const values = params.values();
	ASSERT_EQ(values.size(), 3U);
	EXPECT_STREQ(values[0], "ami-12345678");
	EXPECT_STREQ(values[1], "eu-central-1");
	EXPECT_EQ(values[2], nullptr);
	EXPECT_EQ(params.types()[0], pg::text_oid_v);
	EXPECT_EQ(params.lengths()[1], 12);
	EXPECT_EQ(params.formats()[0], 0);
}

TEST(pg, decode_varchar) {
	auto const result = make_result(pg::varchar_oid_v, {{"ami-12345678"}, {"ami-1a2b3c4d5e6f7j8h9"}});
	ASSERT_TRUE(result);

	auto const first = pg::decode<AwsAmiId>(result.get(), 0, 0);
	ASSERT_TRUE(first.has_value()) << first.error().message;
	EXPECT_EQ(first->to_string(), "ami-12345678");

	auto const second = pg::decode<AwsAmiId>(result.get(), 1, 0);
	ASSERT_TRUE(second.has_value()) << second.error().message;
	EXPECT_TRUE(second->is_long());
}

TEST(pg, decode_text_region) {
	auto const result = make_result(pg::text_oid_v, {{"eu-central-1"}});
	ASSERT_TRUE(result);
	auto const region = pg::decode<RegionId>(result.get(), 0, 0);
	ASSERT_TRUE(region.has_value()) << region.error().message;
	EXPECT_EQ(*region, RegionId::eEuCentral1);
}

TEST(pg, decode_parse_failure) {
	auto const result = make_result(pg::text_oid_v, {{"ami-1234567"}, {"us-north-1"}});
	ASSERT_TRUE(result);

	auto const id = pg::decode<AwsAmiId>(result.get(), 0, 0);
	ASSERT_FALSE(id.has_value());
	EXPECT_EQ(id.error().reason, pg::DecodeError::Reason::eParse);
	EXPECT_EQ(id.error().message, R"(failed to initialize AwsAmiId from "ami-1234567": the unique part must be 8 or 17, not 7 characters long)");

	auto const region = pg::decode<RegionId>(result.get(), 1, 0);
	ASSERT_FALSE(region.has_value());
	EXPECT_EQ(region.error().reason, pg::DecodeError::Reason::eParse);
	EXPECT_EQ(region.error().message, "Unknown region: us-north-1");
}

TEST(pg, decode_null) {
	auto const result = make_result(pg::text_oid_v, {{{}, true}});
	ASSERT_TRUE(result);
	auto const id = pg::decode<AwsAmiId>(result.get(), 0, 0);
	ASSERT_FALSE(id.has_value());
	EXPECT_EQ(id.error().reason, pg::DecodeError::Reason::eNull);
}

TEST(pg, decode_incompatible_type) {
	auto const result = make_result(23, {{"12345678"}});
	ASSERT_TRUE(result);
	auto const id = pg::decode<AwsAmiId>(result.get(), 0, 0);
	ASSERT_FALSE(id.has_value());
	EXPECT_EQ(id.error().reason, pg::DecodeError::Reason::eIncompatibleType);
}

TEST(pg, decode_out_of_range) {
	auto const result = make_result(pg::text_oid_v, {{"ami-12345678"}});
	ASSERT_TRUE(result);
	EXPECT_EQ(pg::decode<AwsAmiId>(result.get(), 1, 0).error().reason, pg::DecodeError::Reason::eOutOfRange);
	EXPECT_EQ(pg::decode<AwsAmiId>(result.get(), 0, 1).error().reason, pg::DecodeError::Reason::eOutOfRange);
	EXPECT_EQ(pg::decode<AwsAmiId>(result.get(), -1, 0).error().reason, pg::DecodeError::Reason::eOutOfRange);
	EXPECT_EQ(pg::decode<AwsAmiId>(nullptr, 0, 0).error().reason, pg::DecodeError::Reason::eOutOfRange);
}
