#include <awsid/id/resource_error.hpp>
#include <awsid/util/visitor.hpp>

namespace awsid {
std::string to_string(ResourceErrorDetail const& detail) {
	auto const visitor = Visitor{
		[](WrongPrefix const& wp) { return fmt::format("incorrect prefix, expected \"{}\"", wp.expected); },
		[](IdLength const& il) { return fmt::format("the unique part must be 8 or 17, not {} characters long", il.actual); },
		[](NonAsciiAlphanumeric const&) { return std::string{"the unique part contains non ascii alphanumeric characters"}; },
	};
	return std::visit(visitor, detail);
}

ResourceError::ResourceError(std::string_view target_type, std::string input, ResourceErrorDetail detail)
	: m_target_type(target_type), m_input(std::move(input)), m_detail(detail) {}

std::string ResourceError::message() const { return fmt::format("failed to initialize {} from \"{}\": {}", m_target_type, m_input, to_string(m_detail)); }

std::ostream& operator<<(std::ostream& out, ResourceError const& error) { return out << error.message(); }
} // namespace awsid
