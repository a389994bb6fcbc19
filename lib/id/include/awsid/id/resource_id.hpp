#pragma once
#include <tl/expected.hpp>
#include <awsid/id/resource_error.hpp>
#include <algorithm>
#include <array>
#include <compare>
#include <concepts>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace awsid {
///
/// \brief Tag type describing one kind of resource.
///
/// prefix_v is the literal every id of this kind starts with (eg "ami-"),
/// name_v is the short type name used in diagnostics (eg "AwsAmiId").
///
template <typename Type>
concept ResourceKind = requires {
	{ Type::prefix_v } -> std::convertible_to<std::string_view>;
	{ Type::name_v } -> std::convertible_to<std::string_view>;
};

constexpr bool is_ascii_alphanumeric(char const ch) { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

///
/// \brief Strongly-typed AWS resource id: Kind's prefix followed by an 8 or 17 character alphanumeric unique part.
///
/// Instances can only be obtained through parse(), so every live instance is valid.
/// The unique part is stored inline; ordering puts 8 character ids before 17 character ones,
/// then compares bytes lexicographically.
///
template <ResourceKind Kind>
class ResourceId {
  public:
	static constexpr std::string_view prefix_v{Kind::prefix_v};
	static constexpr std::string_view name_v{Kind::name_v};
	static constexpr std::size_t short_length_v{8};
	static constexpr std::size_t long_length_v{17};

	///
	/// \brief Validate text and build an id from it.
	/// \param text Full id, prefix included (eg "ami-1234abcd")
	/// \returns ResourceId, or ResourceError describing the first rule that failed; never throws on malformed text
	///
	/// Rules are checked in order: prefix, alphabet of the unique part, length of the unique part.
	///
	static tl::expected<ResourceId, ResourceError> parse(std::string_view text);

	std::string_view unique_part() const {
		return std::visit([](auto const& chars) { return std::string_view{chars.data(), chars.size()}; }, m_unique);
	}

	bool is_long() const { return std::holds_alternative<Long>(m_unique); }

	std::string to_string() const;
	std::string debug_string() const { return fmt::format("{}(\"{}\")", name_v, to_string()); }

	explicit operator std::string() const { return to_string(); }

	auto operator<=>(ResourceId const&) const = default;

  private:
	using Short = std::array<char, short_length_v>;
	using Long = std::array<char, long_length_v>;

	explicit constexpr ResourceId(Short const& chars) : m_unique(chars) {}
	explicit constexpr ResourceId(Long const& chars) : m_unique(chars) {}

	template <typename Chars>
	static constexpr Chars copy_chars(std::string_view const unique) {
		auto ret = Chars{};
		std::copy_n(unique.begin(), ret.size(), ret.begin());
		return ret;
	}

	static tl::unexpected<ResourceError> make_error(std::string_view const text, ResourceErrorDetail detail) {
		return tl::make_unexpected(ResourceError{name_v, std::string{text}, detail});
	}

	std::variant<Short, Long> m_unique;
};

template <ResourceKind Kind>
tl::expected<ResourceId<Kind>, ResourceError> ResourceId<Kind>::parse(std::string_view const text) {
	if (!text.starts_with(prefix_v)) { return make_error(text, WrongPrefix{prefix_v}); }
	auto const unique = text.substr(prefix_v.size());
	if (!std::all_of(unique.begin(), unique.end(), &is_ascii_alphanumeric)) { return make_error(text, NonAsciiAlphanumeric{}); }
	switch (unique.size()) {
	case short_length_v: return ResourceId{copy_chars<Short>(unique)};
	case long_length_v: return ResourceId{copy_chars<Long>(unique)};
	default: return make_error(text, IdLength{unique.size()});
	}
}

template <ResourceKind Kind>
std::string ResourceId<Kind>::to_string() const {
	auto const unique = unique_part();
	auto ret = std::string{};
	ret.reserve(prefix_v.size() + unique.size());
	ret.append(prefix_v);
	ret.append(unique);
	return ret;
}

template <ResourceKind Kind>
std::ostream& operator<<(std::ostream& out, ResourceId<Kind> const& id) {
	return out << id.prefix_v << id.unique_part();
}
} // namespace awsid

namespace std {
template <awsid::ResourceKind Kind>
struct hash<awsid::ResourceId<Kind>> {
	std::size_t operator()(awsid::ResourceId<Kind> const& id) const { return std::hash<std::string_view>{}(id.unique_part()); }
};
} // namespace std

namespace fmt {
template <awsid::ResourceKind Kind>
struct formatter<awsid::ResourceId<Kind>> : formatter<std::string_view> {
	template <typename FormatContext>
	auto format(awsid::ResourceId<Kind> const& id, FormatContext& ctx) const {
		return formatter<std::string_view>::format(id.to_string(), ctx);
	}
};
} // namespace fmt
