#pragma once
#include <fmt/format.h>
#include <tl/expected.hpp>
#include <awsid/util/enum_array.hpp>
#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace awsid {
///
/// \brief Known AWS regions.
///
enum class RegionId : std::uint8_t {
	eAfSouth1,
	eApEast1,
	eApNortheast1,
	eApNortheast2,
	eApNortheast3,
	eApSouth1,
	eApSouth2,
	eApSoutheast1,
	eApSoutheast2,
	eApSoutheast3,
	eApSoutheast4,
	eCaCentral1,
	eCaWest1,
	eEuCentral1,
	eEuCentral2,
	eEuNorth1,
	eEuSouth1,
	eEuSouth2,
	eEuWest1,
	eEuWest2,
	eEuWest3,
	eIlCentral1,
	eMeCentral1,
	eMeSouth1,
	eSaEast1,
	eUsEast1,
	eUsEast2,
	eUsWest1,
	eUsWest2,
	eCOUNT_,
};

///
/// \brief Canonical region codes.
///
constexpr auto region_str = EnumArray<RegionId, std::string_view>{
	"af-south-1",	  "ap-east-1",		"ap-northeast-1", "ap-northeast-2", "ap-northeast-3", "ap-south-1",	  "ap-south-2",
	"ap-southeast-1", "ap-southeast-2", "ap-southeast-3", "ap-southeast-4", "ca-central-1",	  "ca-west-1",	  "eu-central-1",
	"eu-central-2",	  "eu-north-1",		"eu-south-1",	  "eu-south-2",		"eu-west-1",	  "eu-west-2",	  "eu-west-3",
	"il-central-1",	  "me-central-1",	"me-south-1",	  "sa-east-1",		"us-east-1",	  "us-east-2",	  "us-west-1",
	"us-west-2",
};
static_assert(std::size(region_str.t) == static_cast<std::size_t>(RegionId::eCOUNT_));

///
/// \brief Human-readable region locations.
///
constexpr auto region_location_str = EnumArray<RegionId, std::string_view>{
	"Africa (Cape Town)",
	"Asia Pacific (Hong Kong)",
	"Asia Pacific (Tokyo)",
	"Asia Pacific (Seoul)",
	"Asia Pacific (Osaka)",
	"Asia Pacific (Mumbai)",
	"Asia Pacific (Hyderabad)",
	"Asia Pacific (Singapore)",
	"Asia Pacific (Sydney)",
	"Asia Pacific (Jakarta)",
	"Asia Pacific (Melbourne)",
	"Canada (Central)",
	"Canada West (Calgary)",
	"Europe (Frankfurt)",
	"Europe (Zurich)",
	"Europe (Stockholm)",
	"Europe (Milan)",
	"Europe (Spain)",
	"Europe (Ireland)",
	"Europe (London)",
	"Europe (Paris)",
	"Israel (Tel Aviv)",
	"Middle East (UAE)",
	"Middle East (Bahrain)",
	"South America (São Paulo)",
	"US East (N. Virginia)",
	"US East (Ohio)",
	"US West (N. California)",
	"US West (Oregon)",
};
static_assert(std::size(region_location_str.t) == static_cast<std::size_t>(RegionId::eCOUNT_));

///
/// \brief All RegionId values in declaration order.
///
constexpr auto all_regions_v = [] {
	auto ret = std::array<RegionId, static_cast<std::size_t>(RegionId::eCOUNT_)>{};
	for (std::size_t i = 0; i < ret.size(); ++i) { ret[i] = static_cast<RegionId>(i); }
	return ret;
}();

///
/// \brief Failure to parse a RegionId.
///
struct RegionError {
	std::string input{};

	///
	/// \returns Unknown region: <input>
	///
	std::string message() const;

	bool operator==(RegionError const&) const = default;
};

///
/// \brief Exact match of text against the known region codes.
///
/// No case folding, trimming, or prefix matching.
///
tl::expected<RegionId, RegionError> parse_region(std::string_view text);

constexpr std::string_view to_string(RegionId const region) { return region_str[region]; }
constexpr std::string_view location_name(RegionId const region) { return region_location_str[region]; }

std::ostream& operator<<(std::ostream& out, RegionId region);
std::ostream& operator<<(std::ostream& out, RegionError const& error);
} // namespace awsid

template <>
struct fmt::formatter<awsid::RegionId> : fmt::formatter<std::string_view> {
	template <typename FormatContext>
	auto format(awsid::RegionId const region, FormatContext& ctx) const {
		return fmt::formatter<std::string_view>::format(awsid::to_string(region), ctx);
	}
};

template <>
struct fmt::formatter<awsid::RegionError> : fmt::formatter<std::string_view> {
	template <typename FormatContext>
	auto format(awsid::RegionError const& error, FormatContext& ctx) const {
		return fmt::formatter<std::string_view>::format(error.message(), ctx);
	}
};
