#pragma once
#include <concepts>
#include <cstddef>
#include <type_traits>

namespace awsid {
template <typename Type>
concept CountedEnum = std::is_enum_v<Type> && requires { Type::eCOUNT_; };

template <CountedEnum E>
constexpr std::size_t enum_count_v = static_cast<std::size_t>(E::eCOUNT_);

///
/// \brief Fixed-size array indexed by an enum with an eCOUNT_ sentinel.
///
template <CountedEnum E, typename T, std::size_t Size = enum_count_v<E>>
struct EnumArray {
	T t[Size]{};

	constexpr T const& operator[](E const e) const { return t[static_cast<std::size_t>(e)]; }
	constexpr T& operator[](E const e) { return t[static_cast<std::size_t>(e)]; }

	constexpr T const* begin() const { return t; }
	constexpr T const* end() const { return t + Size; }
	static constexpr std::size_t size() { return Size; }
};
} // namespace awsid
