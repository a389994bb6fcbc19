#pragma once
#include <libpq-fe.h>
#include <awsid/codec/text_codec.hpp>
#include <awsid/util/enum_array.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace awsid::pg {
inline constexpr Oid name_oid_v{19};
inline constexpr Oid text_oid_v{25};
inline constexpr Oid unknown_oid_v{705};
inline constexpr Oid bpchar_oid_v{1042};
inline constexpr Oid varchar_oid_v{1043};

///
/// \brief Whether a column of type oid can hold an id / region.
///
constexpr bool is_text_compatible(Oid const oid) {
	switch (oid) {
	case name_oid_v:
	case text_oid_v:
	case unknown_oid_v:
	case bpchar_oid_v:
	case varchar_oid_v: return true;
	default: return false;
	}
}

struct DecodeError {
	enum class Reason : std::uint8_t { eOutOfRange, eNull, eIncompatibleType, eParse, eCOUNT_ };

	Reason reason{};
	std::string message{};
};

constexpr auto decode_reason_str = EnumArray<DecodeError::Reason, std::string_view>{
	"out of range",
	"null",
	"incompatible type",
	"parse",
};

///
/// \brief Obtain the text stored at (row, column).
///
/// Both text and binary result formats are accepted: text-like types share their wire representation.
///
tl::expected<std::string_view, DecodeError> read_text(PGresult const* result, int row, int column);

namespace detail {
tl::unexpected<DecodeError> failed(std::string_view type_name, int row, int column, DecodeError error);
} // namespace detail

///
/// \brief Decode the value at (row, column), running the same validation as parse().
///
template <TextCodable Type>
tl::expected<Type, DecodeError> decode(PGresult const* result, int row, int column) {
	auto text = read_text(result, row, column);
	if (!text) { return detail::failed(TextCodec<Type>::name_v, row, column, std::move(text).error()); }
	auto ret = TextCodec<Type>::decode(text.value());
	if (!ret) { return detail::failed(TextCodec<Type>::name_v, row, column, {DecodeError::Reason::eParse, std::move(ret).error()}); }
	return std::move(ret).value();
}
} // namespace awsid::pg
