#pragma once


/*
    -----------------------------------------------------
    JsonApi type conversion utilities - to_json/from_json
    -----------------------------------------------------
    This header defines the customization points and helpers used to
    convert between `JsonApi::value` and typed C++ entities. Every JSON:API
    model type (links, resources, relationships, documents) is decoded and
    encoded through it, and so are the caller-supplied attribute and
    relationship types of the strongly-typed resource variants.

    ----------
    Core Ideas
    ----------
    - For a type `T`, define in its namespace (found by ADL):

        void to_json(JsonApi::value& out, const T& src);
        JsonApi::Status from_json(const JsonApi::value& src, T& out);

    - `Status` is `std::expected<void, DecodeError>`; decoders never throw
    - `JsonSerializable<T>` / `JsonDeserializable<T>` are the capability
      bounds placed on every generic model parameter

    -------------------
    Builtin Conversions
    -------------------
    - `value` (identity), `bool`, `double`, integral types, `std::string`
    - `std::optional<T>`: JSON null <-> `std::nullopt`
    - `std::vector<T>` <-> JSON array
    - `std::map<std::string, T, std::less<>>` <-> JSON object

    -------
    Helpers
    -------
    - `ObjectReader` walks an object member by member; `remaining()` returns
      every member that was not consumed, which is how extension bags are
      collected
    - `ObjectWriter` emits members in call order and omits absent optionals
      (never writing them as null); `extend()` re-emits an extension bag

    -----
    Usage
    -----
        struct Article { std::string title; std::optional<double> words; };

        void to_json(JsonApi::value& v, const Article& a) {
            JsonApi::ObjectWriter{ v }.field("title", a.title).optional("words", a.words);
        }

        JsonApi::Status from_json(const JsonApi::value& v, Article& a) {
            auto obj = JsonApi::ObjectReader::open(v);
            if (!obj) return std::unexpected(obj.error());
            if (auto s = obj->required("title", a.title); !s) return s;
            return obj->optional("words", a.words);
        }
*/


#include <concepts>
#include <cstdint>
#include <cmath>
#include <expected>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "jsonapi/value.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/config.hpp"


/// @defgroup JsonApiConvert Conversions
/// @ingroup JsonApi
/// @brief Structured encode/decode between `value` and typed entities
namespace JsonApi {

    /// @ingroup JsonApiConvert
    /// @brief Result of a decode step
    using Status = std::expected<void, DecodeError>;

    /// @ingroup JsonApiConvert
    /// @brief Fails with `type_mismatch` unless @p v holds kind @p k
    [[nodiscard]] JSONAPI_API Status expect_kind(const value& v, kind k);

    [[nodiscard]] inline std::string to_std_string(const string& s) { return std::string{ s.data(), s.size() }; }

    // ------------------------------------------------------------
    // Builtin conversions (declared before the concepts so that
    // unqualified lookup inside them sees every overload)
    // ------------------------------------------------------------

    JSONAPI_API void to_json(value& out, const value& v);
    JSONAPI_API void to_json(value& out, bool b);
    JSONAPI_API void to_json(value& out, double d);
    JSONAPI_API void to_json(value& out, std::string_view s);
    JSONAPI_API void to_json(value& out, const char* s);

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    void to_json(value& out, I i);

    template<typename T>
    void to_json(value& out, const std::optional<T>& o);

    template<typename T>
    void to_json(value& out, const std::vector<T>& vec);

    template<typename T>
    void to_json(value& out, const std::map<std::string, T, std::less<>>& map);

    [[nodiscard]] JSONAPI_API Status from_json(const value& v, value& out);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, bool& out);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, double& out);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, std::string& out);

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Status from_json(const value& v, I& out);

    template<typename T>
    [[nodiscard]] Status from_json(const value& v, std::optional<T>& out);

    template<typename T>
    [[nodiscard]] Status from_json(const value& v, std::vector<T>& out);

    template<typename T>
    [[nodiscard]] Status from_json(const value& v, std::map<std::string, T, std::less<>>& out);

    // ------------------------------------------------------------
    // Capability bounds
    // ------------------------------------------------------------

    template<typename T>
    concept JsonSerializable = requires(const T& t, value& v) { { to_json(v, t) } -> std::same_as<void>; };

    template<typename T>
    concept JsonDeserializable = std::default_initializable<T>
        && requires(const value& v, T& t) { { from_json(v, t) } -> std::same_as<Status>; };

    template<typename T>
    concept JsonConvertible = JsonSerializable<T> && JsonDeserializable<T>;

    template<JsonSerializable T>
    [[nodiscard]] inline value serialize(const T& t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) {
        value v{ res };
        to_json(v, t);
        return v;
    }

    template<JsonDeserializable T>
    [[nodiscard]] inline std::expected<T, DecodeError> deserialize(const value& v) {
        T t{};
        if (auto s = from_json(v, t); !s) return std::unexpected(std::move(s.error()));
        return t;
    }

    // ------------------------------------------------------------
    // Object helpers
    // ------------------------------------------------------------

    /// @ingroup JsonApiConvert
    /// @brief Member-by-member reader over a JSON object.
    ///
    /// @details
    /// Tracks which members were consumed so that the leftovers can be kept
    /// as an extension bag. The source value must outlive the reader.
    class ObjectReader {
    public:
        /// @brief Fails with `type_mismatch` unless @p v is an object
        [[nodiscard]] JSONAPI_API static std::expected<ObjectReader, DecodeError> open(const value& v);

        /// @brief Looks up @p key and marks it consumed; `nullptr` when absent
        [[nodiscard]] JSONAPI_API const value* take(std::string_view key);

        /// @brief Decodes a member that must be present; fails with `missing_member`
        template<JsonDeserializable T>
        [[nodiscard]] Status required(std::string_view key, T& out) {
            const value* found = take(key);
            if (!found) return std::unexpected(DecodeError::make(DecodeError::code::missing_member, "required member is missing").within(key));
            if (auto s = from_json(*found, out); !s) return std::unexpected(std::move(s.error().within(key)));
            return {};
        }

        /// @brief Decodes a member that may be absent or null
        template<JsonDeserializable T>
        [[nodiscard]] Status optional(std::string_view key, std::optional<T>& out) {
            out.reset();
            const value* found = take(key);
            if (!found || found->is_null()) return {};
            T decoded{};
            if (auto s = from_json(*found, decoded); !s) return std::unexpected(std::move(s.error().within(key)));
            out = std::move(decoded);
            return {};
        }

        /// @brief Like `optional`, but the member must be a JSON object (`meta`)
        [[nodiscard]] JSONAPI_API Status optional_object(std::string_view key, std::optional<value>& out);

        /// @brief Members never passed to `take`, in source order
        [[nodiscard]] JSONAPI_API object remaining(std::pmr::memory_resource* res = std::pmr::get_default_resource()) const;

    private:
        explicit ObjectReader(const value& v);

        const value* m_Source;
        std::vector<bool> m_Consumed;
    };

    /// @ingroup JsonApiConvert
    /// @brief Appends members to a JSON object in call order.
    class ObjectWriter {
    public:
        /// @brief Turns @p out into an (empty) object if it is not one already
        JSONAPI_API explicit ObjectWriter(value& out);

        template<JsonSerializable T>
        ObjectWriter& field(std::string_view key, const T& v) {
            value& slot = m_Out[key];
            slot = value{ m_Out.resource() };
            to_json(slot, v);
            return *this;
        }

        /// @brief Writes the member only when @p v holds a value
        template<JsonSerializable T>
        ObjectWriter& optional(std::string_view key, const std::optional<T>& v) {
            if (v) field(key, *v);
            return *this;
        }

        /// @brief Appends extension members whose keys were not written yet
        JSONAPI_API ObjectWriter& extend(const object& members);

    private:
        value& m_Out;
    };

    // ------------------------------------------------------------
    // Template definitions
    // ------------------------------------------------------------

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    void to_json(value& out, I i) {
        out = value{ static_cast<double>(i), out.resource() };
    }

    template<typename T>
    void to_json(value& out, const std::optional<T>& o) {
        if (!o) {
            out = value{ nullptr, out.resource() };
            return;
        }
        to_json(out, *o);
    }

    template<typename T>
    void to_json(value& out, const std::vector<T>& vec) {
        auto* res = out.resource();
        auto& arr = out.as_array();
        arr.clear();
        arr.reserve(vec.size());
        for (const auto& item : vec) {
            value elem{ res };
            to_json(elem, item);
            arr.emplace_back(std::move(elem));
        }
    }

    template<typename T>
    void to_json(value& out, const std::map<std::string, T, std::less<>>& map) {
        out = value{ object{ allocator_type(out.resource()) }, out.resource() };
        ObjectWriter writer{ out };
        for (const auto& [key, item] : map) writer.field(key, item);
    }

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Status from_json(const value& v, I& out) {
        if (auto s = expect_kind(v, kind::number); !s) return s;
        double d = v.as_number();
        if (std::trunc(d) != d
            || d < static_cast<double>(std::numeric_limits<I>::lowest())
            || d > static_cast<double>(std::numeric_limits<I>::max())) {
            return std::unexpected(DecodeError::make(DecodeError::code::type_mismatch, "expected an integer in range"));
        }
        out = static_cast<I>(d);
        return {};
    }

    template<typename T>
    Status from_json(const value& v, std::optional<T>& out) {
        if (v.is_null()) {
            out.reset();
            return {};
        }
        T decoded{};
        if (auto s = from_json(v, decoded); !s) return s;
        out = std::move(decoded);
        return {};
    }

    template<typename T>
    Status from_json(const value& v, std::vector<T>& out) {
        if (auto s = expect_kind(v, kind::array); !s) return s;
        out.clear();
        out.reserve(v.size());
        const auto& arr = v.as_array();
        for (std::size_t i = 0; i < arr.size(); i++) {
            T item{};
            if (auto s = from_json(arr[i], item); !s) return std::unexpected(std::move(s.error().within(i)));
            out.push_back(std::move(item));
        }
        return {};
    }

    template<typename T>
    Status from_json(const value& v, std::map<std::string, T, std::less<>>& out) {
        if (auto s = expect_kind(v, kind::object); !s) return s;
        out.clear();
        for (const auto& [key, raw] : v.as_object()) {
            T item{};
            if (auto s = from_json(raw, item); !s) return std::unexpected(std::move(s.error().within(key)));
            out.insert_or_assign(to_std_string(key), std::move(item));
        }
        return {};
    }

} // namespace JsonApi
