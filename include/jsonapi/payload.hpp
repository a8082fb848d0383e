#pragma once


/*
    --------------------------------------------------------
    JsonApi::Payload - the erased `data` member and projection
    --------------------------------------------------------
    A document's (or relationship's) `data` member may be missing, null, a
    single resource object, or an array of them. `Payload` keeps the raw
    subtree together with a shape tag fixed once, when the payload is built:

        member missing      -> shape::absent
        "data": null        -> shape::null
        "data": { ... }     -> shape::object
        "data": [ ... ]     -> shape::array
        "data": 5 / "x"     -> shape::scalar   (rejected later, on projection)

    ----------
    Projection
    ----------
    `single<T>()` and `collection<T>()` match on the tag and decode the raw
    subtree into `T` through the ordinary `from_json` mechanism:

        tag        single<T>()            collection<T>()
        -------    --------------------   -------------------------
        absent     nullopt                nullopt
        null       nullopt                nullopt
        object     T                      shape_mismatch
        array      shape_mismatch         std::vector<T> (maybe empty)
        scalar     shape_mismatch         shape_mismatch   (neither applies)

    Decode failures raised by `T` come back untouched; the payload itself is
    never modified, so a failed projection can simply be retried with
    another target type.

    ----------------
    Typed data slots
    ----------------
    Typed documents and relationships hold `std::optional<T>` or
    `std::optional<std::vector<T>>` instead of a `Payload`. The `detail`
    helpers at the bottom steer a raw `data` member into whichever slot the
    owner declares, going through the projections above so a wrong shape is
    always a `shape_mismatch`.
*/

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonapi/convert.hpp"
#include "jsonapi/value.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/config.hpp"


/// @defgroup JsonApiPayload Payload
/// @ingroup JsonApi
/// @brief Erased resource payload and its single / collection projections
namespace JsonApi {

    class Payload;

    template<typename Data>
    struct BasicRelationship;

    /// @ingroup JsonApiPayload
    /// @brief Relationship whose `data` stays erased
    using Relationship = BasicRelationship<Payload>;

    template<typename Attributes = value, typename Relationships = std::map<std::string, Relationship, std::less<>>>
    struct BasicResource;

    /// @ingroup JsonApiPayload
    /// @brief Schema-agnostic resource: open attributes, erased relationships
    using Resource = BasicResource<>;

    /// @ingroup JsonApiPayload
    /// @brief The `data` member of a document or relationship, not yet materialised.
    class Payload {
    public:
        enum class shape : uint8_t {
            absent,
            null,
            object,
            array,
            scalar,
        };

        /// @brief An absent payload (no `data` member)
        Payload() = default;

        /// @brief Classifies @p data by its JSON kind
        JSONAPI_API explicit Payload(value data);

        /// @brief Encodes @p t and wraps the result
        template<JsonSerializable T>
        [[nodiscard]] static Payload from(const T& t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) {
            return Payload{ serialize(t, res) };
        }

        [[nodiscard]] shape tag() const noexcept { return m_Shape; }

        [[nodiscard]] bool is_absent() const noexcept { return m_Shape == shape::absent; }
        [[nodiscard]] bool is_null() const noexcept { return m_Shape == shape::null; }
        [[nodiscard]] bool is_single() const noexcept { return m_Shape == shape::object; }
        [[nodiscard]] bool is_collection() const noexcept { return m_Shape == shape::array; }

        /// @brief The untyped subtree; a JSON null when absent
        [[nodiscard]] const value& raw() const noexcept { return m_Data; }

        /// @brief Materialises object-shaped data as one `T`
        template<JsonDeserializable T = Resource>
        [[nodiscard]] std::expected<std::optional<T>, DecodeError> single() const {
            switch (m_Shape) {
            case shape::absent:
            case shape::null:
                return std::optional<T>{};
            case shape::object: {
                T out{};
                if (auto s = from_json(m_Data, out); !s) return std::unexpected(std::move(s.error()));
                return std::optional<T>{ std::move(out) };
            }
            case shape::array:
                return std::unexpected(not_an_object());
            default:
                return std::unexpected(not_a_resource());
            }
        }

        /// @brief Materialises array-shaped data as a sequence of `T`
        template<JsonDeserializable T = Resource>
        [[nodiscard]] std::expected<std::optional<std::vector<T>>, DecodeError> collection() const {
            switch (m_Shape) {
            case shape::absent:
            case shape::null:
                return std::optional<std::vector<T>>{};
            case shape::array: {
                std::vector<T> out;
                if (auto s = from_json(m_Data, out); !s) return std::unexpected(std::move(s.error()));
                return std::optional<std::vector<T>>{ std::move(out) };
            }
            case shape::object:
                return std::unexpected(not_an_array());
            default:
                return std::unexpected(not_a_resource());
            }
        }

        friend bool operator==(const Payload&, const Payload&) = default;

    private:
        [[nodiscard]] JSONAPI_API static DecodeError not_an_object();
        [[nodiscard]] JSONAPI_API static DecodeError not_an_array();
        [[nodiscard]] JSONAPI_API static DecodeError not_a_resource();

        shape m_Shape{ shape::absent };
        value m_Data{};
    };

    [[nodiscard]] JSONAPI_API std::string_view shape_name(Payload::shape s) noexcept;

    /// @brief Writes the raw subtree; an absent payload is written as null
    JSONAPI_API void to_json(value& out, const Payload& payload);

    /// @brief Never fails: every JSON value has a shape
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, Payload& out);

    namespace detail {

        /// @brief Reads a `data` member (`nullptr` when missing) into an erased slot
        [[nodiscard]] JSONAPI_API Status read_data(const value* raw, Payload& out);

        template<JsonDeserializable T>
        [[nodiscard]] Status read_data(const value* raw, std::optional<T>& out) {
            Payload payload{};
            if (raw) payload = Payload{ *raw };
            auto projected = payload.single<T>();
            if (!projected) return std::unexpected(std::move(projected.error()));
            out = std::move(*projected);
            return {};
        }

        template<JsonDeserializable T>
        [[nodiscard]] Status read_data(const value* raw, std::optional<std::vector<T>>& out) {
            Payload payload{};
            if (raw) payload = Payload{ *raw };
            auto projected = payload.collection<T>();
            if (!projected) return std::unexpected(std::move(projected.error()));
            out = std::move(*projected);
            return {};
        }

        [[nodiscard]] inline Payload::shape data_shape(const Payload& data) noexcept { return data.tag(); }

        template<typename T>
        [[nodiscard]] Payload::shape data_shape(const std::optional<T>& data) noexcept {
            return data ? Payload::shape::object : Payload::shape::absent;
        }

        template<typename T>
        [[nodiscard]] Payload::shape data_shape(const std::optional<std::vector<T>>& data) noexcept {
            return data ? Payload::shape::array : Payload::shape::absent;
        }

        /// @brief Omits an absent payload, keeps an explicit null
        JSONAPI_API void write_data(ObjectWriter& writer, std::string_view key, const Payload& data);

        template<JsonSerializable T>
        void write_data(ObjectWriter& writer, std::string_view key, const std::optional<T>& data) {
            writer.optional(key, data);
        }

    } // namespace detail

    /// @ingroup JsonApiPayload
    /// @brief Types usable as the `data` slot of a document or relationship
    template<typename D>
    concept DataSlot = std::default_initializable<D>
        && requires(const value* raw, D& d, ObjectWriter& w, const D& cd) {
            { detail::read_data(raw, d) } -> std::same_as<Status>;
            { detail::data_shape(cd) } -> std::same_as<Payload::shape>;
            detail::write_data(w, std::string_view{}, cd);
        };

} // namespace JsonApi
