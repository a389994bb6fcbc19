#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace awsid {
///
/// \brief Input didn't start with the kind's prefix.
///
struct WrongPrefix {
	std::string_view expected{};

	bool operator==(WrongPrefix const&) const = default;
};

///
/// \brief Unique part was neither 8 nor 17 characters long.
///
struct IdLength {
	std::size_t actual{};

	bool operator==(IdLength const&) const = default;
};

///
/// \brief Unique part contained something other than [0-9a-zA-Z].
///
struct NonAsciiAlphanumeric {
	bool operator==(NonAsciiAlphanumeric const&) const = default;
};

using ResourceErrorDetail = std::variant<WrongPrefix, IdLength, NonAsciiAlphanumeric>;

///
/// \brief Render the failed sub-condition, eg "incorrect prefix, expected \"ami-\"".
///
std::string to_string(ResourceErrorDetail const& detail);

///
/// \brief Failure to parse a ResourceId.
///
/// Carries the short name of the target type, the offending input (verbatim), and the failed sub-condition.
///
class ResourceError {
  public:
	ResourceError(std::string_view target_type, std::string input, ResourceErrorDetail detail);

	std::string_view target_type() const { return m_target_type; }
	std::string_view input() const { return m_input; }
	ResourceErrorDetail const& detail() const { return m_detail; }

	///
	/// \brief Human-readable diagnostic.
	/// \returns failed to initialize <target_type> from "<input>": <detail>
	///
	std::string message() const;

	bool operator==(ResourceError const&) const = default;

  private:
	std::string_view m_target_type{};
	std::string m_input{};
	ResourceErrorDetail m_detail{};
};

std::ostream& operator<<(std::ostream& out, ResourceError const& error);
} // namespace awsid

template <>
struct fmt::formatter<awsid::ResourceError> : fmt::formatter<std::string_view> {
	template <typename FormatContext>
	auto format(awsid::ResourceError const& error, FormatContext& ctx) const {
		return fmt::formatter<std::string_view>::format(error.message(), ctx);
	}
};
