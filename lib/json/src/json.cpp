#include <awsid/json/json.hpp>
#include <awsid/util/logger.hpp>

namespace awsid::json {
std::string detail::not_a_string(std::string_view type_name) { return fmt::format("failed to initialize {} from JSON: expected a string", type_name); }

std::string detail::not_an_array(std::string_view type_name) { return fmt::format("failed to initialize {} from JSON: expected an array", type_name); }

std::string detail::bad_element(std::size_t index, std::string_view error) { return fmt::format("element [{}]: {}", index, error); }

void detail::log_failure(std::string_view type_name, std::string_view error) { logger::debug("[json] Failed to decode {}: {}", type_name, error); }
} // namespace awsid::json
