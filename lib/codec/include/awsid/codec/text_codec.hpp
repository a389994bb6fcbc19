#pragma once
#include <awsid/id/resource_id.hpp>
#include <awsid/region/region.hpp>
#include <concepts>
#include <string>
#include <string_view>

namespace awsid {
///
/// \brief Canonical text form of a value, shared by every storage / serialization boundary.
///
/// Specializations provide:
/// - name_v: type name used in diagnostics
/// - encode(Type const&) -> std::string
/// - decode(std::string_view) -> tl::expected<Type, std::string> (error is the rendered diagnostic)
///
template <typename Type>
struct TextCodec;

template <ResourceKind Kind>
struct TextCodec<ResourceId<Kind>> {
	static constexpr std::string_view name_v{Kind::name_v};

	static std::string encode(ResourceId<Kind> const& id) { return id.to_string(); }

	static tl::expected<ResourceId<Kind>, std::string> decode(std::string_view const text) {
		return ResourceId<Kind>::parse(text).map_error([](ResourceError const& error) { return error.message(); });
	}
};

template <>
struct TextCodec<RegionId> {
	static constexpr std::string_view name_v{"AwsRegionId"};

	static std::string encode(RegionId const region) { return std::string{to_string(region)}; }

	static tl::expected<RegionId, std::string> decode(std::string_view const text) {
		return parse_region(text).map_error([](RegionError const& error) { return error.message(); });
	}
};

template <typename Type>
concept TextCodable = requires(Type const& t, std::string_view const text) {
	{ TextCodec<Type>::name_v } -> std::convertible_to<std::string_view>;
	{ TextCodec<Type>::encode(t) } -> std::same_as<std::string>;
	{ TextCodec<Type>::decode(text) } -> std::same_as<tl::expected<Type, std::string>>;
};
} // namespace awsid
