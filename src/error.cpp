#include "jsonapi/error.hpp"

#include <string>


namespace JsonApi {

    namespace {
        std::string escape_segment(std::string_view segment) {
            std::string out;
            out.reserve(segment.size() + 1);
            out.push_back('/');
            for (char c : segment) {
                if (c == '~') out += "~0";
                else if (c == '/') out += "~1";
                else out.push_back(c);
            }
            return out;
        }
    } // namespace

    ParseError ParseError::make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    DecodeError DecodeError::make(code c, std::string_view m, std::string_view pointer) {
        DecodeError e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        e.pointer.assign(pointer.begin(), pointer.end());
        return e;
    }

    DecodeError DecodeError::from(const ParseError& p) {
        DecodeError e;
        e.errc = code::syntax;
        e.msg = p.msg;
        e.syntax = p;
        return e;
    }

    DecodeError& DecodeError::within(std::string_view segment) {
        pointer.insert(0, escape_segment(segment));
        return *this;
    }

    DecodeError& DecodeError::within(std::size_t index) {
        pointer.insert(0, "/" + std::to_string(index));
        return *this;
    }

    std::string_view code_name(ParseError::code c) noexcept {
        using enum ParseError::code;
        switch (c) {
        case unexpected_character: return "unexpected_character";
        case invalid_number: return "invalid_number";
        case invalid_string: return "invalid_string";
        case invalid_escape: return "invalid_escape";
        case invalid_unicode_escape: return "invalid_unicode_escape";
        case unexpected_end_of_input: return "unexpected_end_of_input";
        case trailing_characters: return "trailing_characters";
        case comment_not_allowed: return "comment_not_allowed";
        case trailing_comma_not_allowed: return "trailing_comma_not_allowed";
        case depth_limit_exceeded: return "depth_limit_exceeded";
        }
        return "unknown";
    }

    std::string_view code_name(DecodeError::code c) noexcept {
        using enum DecodeError::code;
        switch (c) {
        case syntax: return "syntax";
        case malformed_link: return "malformed_link";
        case shape_mismatch: return "shape_mismatch";
        case missing_member: return "missing_member";
        case type_mismatch: return "type_mismatch";
        case invalid_media_type: return "invalid_media_type";
        }
        return "unknown";
    }

    std::string describe(const ParseError& e) {
        std::string out{ code_name(e.errc) };
        out += ": ";
        out += e.msg;
        out += " (line " + std::to_string(e.line) + ", column " + std::to_string(e.column) + ")";
        return out;
    }

    std::string describe(const DecodeError& e) {
        if (e.errc == DecodeError::code::syntax) return describe(e.syntax);
        std::string out{ code_name(e.errc) };
        out += ": ";
        out += e.msg;
        if (!e.pointer.empty()) {
            out += " at ";
            out += e.pointer;
        }
        return out;
    }

} // namespace JsonApi
