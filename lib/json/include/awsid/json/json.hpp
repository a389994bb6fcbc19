#pragma once
#include <djson/json.hpp>
#include <tl/expected.hpp>
#include <awsid/codec/text_codec.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace awsid::json {
namespace detail {
std::string not_a_string(std::string_view type_name);
std::string not_an_array(std::string_view type_name);
std::string bad_element(std::size_t index, std::string_view error);
void log_failure(std::string_view type_name, std::string_view error);
} // namespace detail

///
/// \brief Write the canonical text form of value into out.
///
template <TextCodable Type>
void to_json(dj::Json& out, Type const& value) {
	out = TextCodec<Type>::encode(value);
}

///
/// \brief Write values as a JSON array of canonical strings; an empty vector yields [].
///
template <TextCodable Type>
void to_json(dj::Json& out, std::vector<Type> const& values) {
	auto array = dj::Json::parse("[]");
	for (auto const& value : values) {
		auto element = dj::Json{};
		to_json(element, value);
		array.push_back(std::move(element));
	}
	out = std::move(array);
}

///
/// \brief Read a Type from a JSON string, running the same validation as parse().
/// \returns Type, or the rendered diagnostic if json isn't a string or fails validation
///
template <TextCodable Type>
tl::expected<Type, std::string> from_json(dj::Json const& json) {
	if (!json.is_string()) {
		auto error = detail::not_a_string(TextCodec<Type>::name_v);
		detail::log_failure(TextCodec<Type>::name_v, error);
		return tl::make_unexpected(std::move(error));
	}
	auto ret = TextCodec<Type>::decode(json.as_string());
	if (!ret) { detail::log_failure(TextCodec<Type>::name_v, ret.error()); }
	return ret;
}

///
/// \brief Read an array of Type; fails if json isn't an array or on the first invalid element.
///
template <TextCodable Type>
tl::expected<std::vector<Type>, std::string> from_json_array(dj::Json const& json) {
	if (!json.is_array()) {
		auto error = detail::not_an_array(TextCodec<Type>::name_v);
		detail::log_failure(TextCodec<Type>::name_v, error);
		return tl::make_unexpected(std::move(error));
	}
	auto ret = std::vector<Type>{};
	std::size_t index{};
	for (auto const& element : json.array_view()) {
		auto value = from_json<Type>(element);
		if (!value) { return tl::make_unexpected(detail::bad_element(index, value.error())); }
		ret.push_back(std::move(value).value());
		++index;
	}
	return ret;
}
} // namespace awsid::json
