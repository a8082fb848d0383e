#pragma once


/*
    --------------------------------------
    JsonApi::value - Dynamic JSON DOM node
    --------------------------------------
    The `JsonApi::value` type represents any JSON value:
        - null
        - boolean
        - number (as double)
        - string
        - array
        - object
    It is the untyped tree every JSON:API entity is decoded from and encoded
    into. Open-ended members (`meta`, weakly-typed `attributes`, extension
    members, the erased `data` payload) are stored as `value`s directly.

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Copy construction/assignment deep-copies the tree into the source's
      memory resource
    - Move construction/assignment steals the allocator and storage

    ------------
    Object Order
    ------------
    - Objects are stored as a vector of `(key, value)` members and keep
      insertion order. Writers rely on this: a link object is emitted with
      `href` first, and extension members re-emit in the order they were read
    - Assigning through `operator[]` to an existing key replaces the value in
      place; the member keeps its original position
    - Equality treats objects as unordered maps: `{"a":1,"b":2}` equals
      `{"b":2,"a":1}`

    -----------------------------
    Accessors and Auto-Conversion
    -----------------------------
    - Scalar accessors `as_bool()`, `as_number()`, `as_string()` assume the
      current kind matches and throw `std::bad_variant_access` otherwise
    - Non-const `as_array()` / `as_object()` convert the value in place to an
      empty container of that kind when necessary
    - `find(key)` returns `nullptr` for missing keys or non-object values;
      `at(key)` throws `std::out_of_range`

    -------------
    Thread-Safety
    -------------
    - Separate `value` instances may be used from different threads
    - Concurrent access to one instance must be externally synchronized
*/


#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "jsonapi/config.hpp"

/// @defgroup JsonApi JsonApi Library
/// @brief JSON:API object model and codec

/// @defgroup JsonApiValue DOM Value
/// @ingroup JsonApi
/// @brief The dynamic JSON value type underlying every entity
namespace JsonApi {

    /// @ingroup JsonApiValue
    /// @brief Enumerates the possible JSON value kinds held by JsonApi::value
    enum class kind : uint8_t {
        null,    ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number,  ///< JSON number value (stored as `double`)
        string,  ///< JSON string value
        array,   ///< JSON array value
        object,  ///< JSON object value
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup JsonApiValue
    /// @brief String type used by JsonApi::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup JsonApiValue
    /// @brief Array type used by JsonApi::value
    using array = pmr_vector<value>;

    /// @ingroup JsonApiValue
    /// @brief A single object member
    using member = std::pair<string, value>;

    /// @ingroup JsonApiValue
    /// @brief Object type used by JsonApi::value, members in insertion order
    using object = pmr_vector<member>;

    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;

    /// @ingroup JsonApiValue
    /// @brief Dynamic JSON DOM node.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment
        // ------------------------------------------------------------

        JSONAPI_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        JSONAPI_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        JSONAPI_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        JSONAPI_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        template<std::integral I>
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        JSONAPI_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        JSONAPI_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        JSONAPI_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        JSONAPI_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        JSONAPI_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        JSONAPI_API value(const value& other);

        JSONAPI_API value(value&& other) noexcept;

        JSONAPI_API value& operator=(const value& other);

        JSONAPI_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        [[nodiscard]] JSONAPI_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        [[nodiscard]] JSONAPI_API bool&       as_bool();
        [[nodiscard]] JSONAPI_API const bool& as_bool() const;

        [[nodiscard]] JSONAPI_API double&       as_number();
        [[nodiscard]] JSONAPI_API const double& as_number() const;

        [[nodiscard]] JSONAPI_API string&       as_string();
        [[nodiscard]] JSONAPI_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        [[nodiscard]] JSONAPI_API array&       as_array();
        [[nodiscard]] JSONAPI_API const array& as_array() const;

        [[nodiscard]] JSONAPI_API object&       as_object();
        [[nodiscard]] JSONAPI_API const object& as_object() const;

        /// @brief Number of elements (array) or members (object); 0 for scalars
        [[nodiscard]] JSONAPI_API std::size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Array element access; grows the array with nulls as needed
        JSONAPI_API value& operator[](std::size_t idx);

        /// @brief Array element access; returns a null sentinel when out of range
        JSONAPI_API const value& operator[](std::size_t idx) const;

        /// @brief Object member access; appends a null member when missing
        JSONAPI_API value& operator[](std::string_view key);

        [[nodiscard]] JSONAPI_API const value* find(std::string_view key) const;

        [[nodiscard]] JSONAPI_API value* find(std::string_view key);

        [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

        [[nodiscard]] JSONAPI_API const value& at(std::string_view key) const;

        /// @brief Removes the member named @p key, returns whether it existed
        JSONAPI_API bool erase(std::string_view key);

        /// @brief Structural equality; object member order is ignored
        friend JSONAPI_API bool operator==(const value& lhs, const value& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

    /// @ingroup JsonApiValue
    /// @brief Member-wise equality that ignores key order
    [[nodiscard]] JSONAPI_API bool same_members(const object& lhs, const object& rhs);

    /// @ingroup JsonApiValue
    /// @brief Human-readable name of a value kind ("null", "object", ...)
    [[nodiscard]] JSONAPI_API std::string_view kind_name(kind k) noexcept;

} // namespace JsonApi
