#include <awsid/pg/column.hpp>
#include <awsid/util/logger.hpp>

namespace awsid::pg {
tl::expected<std::string_view, DecodeError> read_text(PGresult const* result, int row, int column) {
	if (!result || row < 0 || column < 0 || row >= PQntuples(result) || column >= PQnfields(result)) {
		return tl::make_unexpected(DecodeError{DecodeError::Reason::eOutOfRange, fmt::format("no value at row {}, column {}", row, column)});
	}
	if (PQgetisnull(result, row, column)) { return tl::make_unexpected(DecodeError{DecodeError::Reason::eNull, fmt::format("column {} is NULL", column)}); }
	if (auto const oid = PQftype(result, column); !is_text_compatible(oid)) {
		return tl::make_unexpected(DecodeError{DecodeError::Reason::eIncompatibleType, fmt::format("column {} has type oid {}, expected a text type", column, oid)});
	}
	auto const length = PQgetlength(result, row, column);
	return std::string_view{PQgetvalue(result, row, column), static_cast<std::size_t>(length)};
}

tl::unexpected<DecodeError> detail::failed(std::string_view type_name, int row, int column, DecodeError error) {
	logger::debug("[pg] Failed to decode {} at ({}, {}) [{}]: {}", type_name, row, column, decode_reason_str[error.reason], error.message);
	return tl::make_unexpected(std::move(error));
}
} // namespace awsid::pg
