#include "jsonapi/payload.hpp"


namespace JsonApi {

    namespace {
        Payload::shape classify(const value& v) noexcept {
            switch (v.type()) {
            case kind::null:   return Payload::shape::null;
            case kind::object: return Payload::shape::object;
            case kind::array:  return Payload::shape::array;
            default:           return Payload::shape::scalar;
            }
        }
    } // namespace

    Payload::Payload(value data)
        : m_Shape{ classify(data) }, m_Data{ std::move(data) } {}

    DecodeError Payload::not_an_object() {
        return DecodeError::make(DecodeError::code::shape_mismatch, "data is not an object; use the collection projection");
    }

    DecodeError Payload::not_an_array() {
        return DecodeError::make(DecodeError::code::shape_mismatch, "data is not an array; use the single projection");
    }

    DecodeError Payload::not_a_resource() {
        return DecodeError::make(DecodeError::code::shape_mismatch, "data is neither an object nor an array");
    }

    std::string_view shape_name(Payload::shape s) noexcept {
        switch (s) {
        case Payload::shape::absent: return "absent";
        case Payload::shape::null:   return "null";
        case Payload::shape::object: return "object";
        case Payload::shape::array:  return "array";
        case Payload::shape::scalar: return "scalar";
        }
        return "unknown";
    }

    void to_json(value& out, const Payload& payload) {
        if (payload.is_absent()) {
            out = value{ nullptr, out.resource() };
            return;
        }
        out = payload.raw();
    }

    Status from_json(const value& v, Payload& out) {
        out = Payload{ v };
        return {};
    }

    namespace detail {

        Status read_data(const value* raw, Payload& out) {
            out = raw ? Payload{ *raw } : Payload{};
            return {};
        }

        void write_data(ObjectWriter& writer, std::string_view key, const Payload& data) {
            if (!data.is_absent()) writer.field(key, data);
        }

    } // namespace detail

} // namespace JsonApi
