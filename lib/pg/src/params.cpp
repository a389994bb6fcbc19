#include <awsid/pg/params.hpp>

namespace awsid::pg {
namespace {
constexpr int text_format_v{0};
} // namespace

Params& Params::add_text(std::string text) {
	m_types.push_back(text_oid_v);
	m_lengths.push_back(static_cast<int>(text.size()));
	m_formats.push_back(text_format_v);
	m_texts.emplace_back(std::move(text));
	return *this;
}

Params& Params::add_null() {
	m_types.push_back(text_oid_v);
	m_lengths.push_back(0);
	m_formats.push_back(text_format_v);
	m_texts.emplace_back();
	return *this;
}

std::vector<char const*> Params::values() const {
	auto ret = std::vector<char const*>{};
	ret.reserve(m_texts.size());
	for (auto const& text : m_texts) { ret.push_back(text ? text->c_str() : nullptr); }
	return ret;
}

std::optional<std::string_view> Params::text_at(int index) const {
	if (index < 0 || index >= size()) { return {}; }
	auto const& text = m_texts[static_cast<std::size_t>(index)];
	if (!text) { return {}; }
	return *text;
}
} // namespace awsid::pg
