#include "jsonapi/value.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>


namespace JsonApi {

    namespace {
        object::iterator find_member(object& obj, std::string_view key) {
            return std::find_if(obj.begin(), obj.end(), [key](const member& m) { return m.first == key; });
        }

        object::const_iterator find_member(const object& obj, std::string_view key) {
            return std::find_if(obj.begin(), obj.end(), [key](const member& m) { return m.first == key; });
        }

    } // namespace

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : value(res) {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : value(std::string_view{ s }, res) {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ sv.begin(), sv.end(), res } } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(o) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        // Clone first: `other` may live inside this tree.
        storage_t copy = clone_storage(other.m_Storage, other.m_MemRes);
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(copy);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    // Alternatives of storage_t are declared in the order of `kind`.
    kind value::type() const noexcept {
        return static_cast<kind>(m_Storage.index());
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    double& value::as_number() { return std::get<double>(m_Storage); }
    const double& value::as_number() const { return std::get<double>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    array& value::as_array() { if (!is_array()) m_Storage = array{ allocator_type(m_MemRes) }; return std::get<array>(m_Storage); }
    const array& value::as_array() const { return std::get<array>(m_Storage); }
    object& value::as_object() { if (!is_object()) m_Storage = object{ allocator_type(m_MemRes) }; return std::get<object>(m_Storage); }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    std::size_t value::size() const noexcept {
        if (is_array()) return std::get<array>(m_Storage).size();
        if (is_object()) return std::get<object>(m_Storage).size();
        return 0;
    }

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        if (idx >= arr.size()) {
            arr.resize(idx + 1, value{ m_MemRes });
        }
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value missing{};
        const auto* arr = std::get_if<array>(&m_Storage);
        return arr && idx < arr->size() ? (*arr)[idx] : missing;
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        if (auto it = find_member(obj, key); it != obj.end()) return it->second;
        obj.emplace_back(string{ key.begin(), key.end(), m_MemRes }, value{ m_MemRes });
        return obj.back().second;
    }

    const value* value::find(std::string_view key) const {
        const auto* obj = std::get_if<object>(&m_Storage);
        if (!obj) return nullptr;
        auto it = find_member(*obj, key);
        return it != obj->end() ? &it->second : nullptr;
    }

    value* value::find(std::string_view key) {
        return const_cast<value*>(std::as_const(*this).find(key));
    }

    const value& value::at(std::string_view key) const {
        if (const value* v = find(key)) return *v;
        throw std::out_of_range{ "JsonApi::value::at: key not found" };
    }

    bool value::erase(std::string_view key) {
        if (!is_object()) return false;
        auto& obj = std::get<object>(m_Storage);
        auto it = find_member(obj, key);
        if (it == obj.end()) return false;
        obj.erase(it);
        return true;
    }

    bool operator==(const value& lhs, const value& rhs) {
        if (lhs.type() != rhs.type()) return false;
        switch (lhs.type()) {
        case kind::null: return true;
        case kind::boolean: return lhs.as_bool() == rhs.as_bool();
        case kind::number: return lhs.as_number() == rhs.as_number();
        case kind::string: return lhs.as_string() == rhs.as_string();
        case kind::array: return lhs.as_array() == rhs.as_array();
        case kind::object: return same_members(lhs.as_object(), rhs.as_object());
        }
        return false;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<double>(s);
        case 3: return string{ std::get<string>(s), res };
        case 4: {
            array copy(std::get<array>(s), allocator_type{ res });
            return copy;
        }
        case 5: {
            object copy(std::get<object>(s), allocator_type{ res });
            return copy;
        }
        }
        return std::monostate{};
    }

    bool same_members(const object& lhs, const object& rhs) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto& [k, v] : lhs) {
            auto it = find_member(rhs, k);
            if (it == rhs.end() || !(it->second == v)) return false;
        }
        // Sizes alone miss duplicate keys on one side.
        for (const auto& [k, v] : rhs) {
            if (find_member(lhs, k) == lhs.end()) return false;
        }
        return true;
    }

    std::string_view kind_name(kind k) noexcept {
        switch (k) {
        case kind::null: return "null";
        case kind::boolean: return "boolean";
        case kind::number: return "number";
        case kind::string: return "string";
        case kind::array: return "array";
        case kind::object: return "object";
        }
        return "unknown";
    }

} // namespace JsonApi
