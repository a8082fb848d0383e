#include "jsonapi/jsonapi.hpp"

#include <algorithm>
#include <istream>
#include <iterator>


namespace JsonApi {

    namespace detail {

        std::expected<std::optional<value>, DecodeError> read_body(std::istream& is, const ParseOptions& opts) {
            std::string body{ std::istreambuf_iterator<char>{ is }, std::istreambuf_iterator<char>{} };
            bool blank = std::all_of(body.begin(), body.end(), [](char c) {
                return c == ' ' || c == '\t' || c == '\n' || c == '\r';
            });
            if (blank) return std::optional<value>{};

            auto tree = parse(body, opts);
            if (!tree) return std::unexpected(DecodeError::from(tree.error()));
            if (tree->is_null()) return std::optional<value>{};
            return std::optional<value>{ std::move(*tree) };
        }

    } // namespace detail

    std::expected<Document, DecodeError> parse_document(std::string_view text, const ParseOptions& opts) {
        return parse_as<Document>(text, opts);
    }

    std::expected<std::optional<Link>, DecodeError> parse_link(std::string_view text, const ParseOptions& opts) {
        auto tree = parse(text, opts);
        if (!tree) return std::unexpected(DecodeError::from(tree.error()));
        return read_link(*tree);
    }

} // namespace JsonApi
