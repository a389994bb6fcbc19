#pragma once
#include <awsid/pg/column.hpp>
#include <optional>
#include <string>
#include <vector>

namespace awsid::pg {
///
/// \brief Parameter list for PQexecParams.
///
/// Ids and regions are bound as text. Usage:
/// \code
/// auto params = pg::Params{};
/// params.add(instance_id).add(region);
/// auto const values = params.values();
/// PQexecParams(conn, sql, params.size(), params.types(), values.data(), params.lengths(), params.formats(), 0);
/// \endcode
///
class Params {
  public:
	template <TextCodable Type>
	Params& add(Type const& value) {
		return add_text(TextCodec<Type>::encode(value));
	}

	template <TextCodable Type>
	Params& add(std::optional<Type> const& value) {
		return value ? add(*value) : add_null();
	}

	Params& add_text(std::string text);
	Params& add_null();

	int size() const { return static_cast<int>(m_texts.size()); }

	Oid const* types() const { return m_types.data(); }
	int const* lengths() const { return m_lengths.data(); }
	int const* formats() const { return m_formats.data(); }

	///
	/// \brief Obtain pointers to each value (nullptr for NULL).
	///
	/// Pointers are invalidated by the next add*() call.
	///
	std::vector<char const*> values() const;

	std::optional<std::string_view> text_at(int index) const;

  private:
	std::vector<std::optional<std::string>> m_texts{};
	std::vector<Oid> m_types{};
	std::vector<int> m_lengths{};
	std::vector<int> m_formats{};
};
} // namespace awsid::pg
