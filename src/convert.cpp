#include "jsonapi/convert.hpp"

#include <algorithm>


namespace JsonApi {

    Status expect_kind(const value& v, kind k) {
        if (v.type() == k) return {};
        std::string msg{ "expected " };
        msg += kind_name(k);
        msg += ", got ";
        msg += kind_name(v.type());
        return std::unexpected(DecodeError::make(DecodeError::code::type_mismatch, msg));
    }

    void to_json(value& out, const value& v) { out = v; }
    void to_json(value& out, bool b) { out = value{ b, out.resource() }; }
    void to_json(value& out, double d) { out = value{ d, out.resource() }; }
    void to_json(value& out, std::string_view s) { out = value{ s, out.resource() }; }
    void to_json(value& out, const char* s) { out = value{ s, out.resource() }; }

    Status from_json(const value& v, value& out) {
        out = v;
        return {};
    }

    Status from_json(const value& v, bool& out) {
        if (auto s = expect_kind(v, kind::boolean); !s) return s;
        out = v.as_bool();
        return {};
    }

    Status from_json(const value& v, double& out) {
        if (auto s = expect_kind(v, kind::number); !s) return s;
        out = v.as_number();
        return {};
    }

    Status from_json(const value& v, std::string& out) {
        if (auto s = expect_kind(v, kind::string); !s) return s;
        out = to_std_string(v.as_string());
        return {};
    }

    ObjectReader::ObjectReader(const value& v)
        : m_Source{ &v }, m_Consumed(v.size(), false) {}

    std::expected<ObjectReader, DecodeError> ObjectReader::open(const value& v) {
        if (auto s = expect_kind(v, kind::object); !s) return std::unexpected(std::move(s.error()));
        return ObjectReader{ v };
    }

    const value* ObjectReader::take(std::string_view key) {
        const auto& obj = m_Source->as_object();
        for (std::size_t i = 0; i < obj.size(); i++) {
            if (obj[i].first != key) continue;
            m_Consumed[i] = true;
            return &obj[i].second;
        }
        return nullptr;
    }

    Status ObjectReader::optional_object(std::string_view key, std::optional<value>& out) {
        out.reset();
        const value* found = take(key);
        if (!found || found->is_null()) return {};
        if (auto s = expect_kind(*found, kind::object); !s) return std::unexpected(std::move(s.error().within(key)));
        out = *found;
        return {};
    }

    object ObjectReader::remaining(std::pmr::memory_resource* res) const {
        const auto& obj = m_Source->as_object();
        object out{ allocator_type(res) };
        for (std::size_t i = 0; i < obj.size(); i++) {
            if (!m_Consumed[i]) out.emplace_back(string{ obj[i].first, res }, value{ obj[i].second });
        }
        return out;
    }

    ObjectWriter::ObjectWriter(value& out)
        : m_Out{ out } {
        if (!m_Out.is_object()) m_Out = value{ object{ allocator_type(m_Out.resource()) }, m_Out.resource() };
    }

    ObjectWriter& ObjectWriter::extend(const object& members) {
        for (const auto& [key, v] : members) {
            if (m_Out.contains(key)) continue;
            m_Out[key] = v;
        }
        return *this;
    }

} // namespace JsonApi
