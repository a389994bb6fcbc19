#include <awsid/region/region.hpp>
#include <algorithm>
#include <iterator>

namespace awsid {
std::string RegionError::message() const { return fmt::format("Unknown region: {}", input); }

tl::expected<RegionId, RegionError> parse_region(std::string_view const text) {
	auto const it = std::find(region_str.begin(), region_str.end(), text);
	if (it == region_str.end()) { return tl::make_unexpected(RegionError{std::string{text}}); }
	return static_cast<RegionId>(std::distance(region_str.begin(), it));
}

std::ostream& operator<<(std::ostream& out, RegionId const region) { return out << to_string(region); }
std::ostream& operator<<(std::ostream& out, RegionError const& error) { return out << error.message(); }
} // namespace awsid
