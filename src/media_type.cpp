#include "jsonapi/media_type.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>


namespace JsonApi {

    namespace {
        constexpr std::string_view media_type_name = JSONAPI_MEDIA_TYPE;

        std::unexpected<DecodeError> invalid(std::string_view msg) {
            return std::unexpected(DecodeError::make(DecodeError::code::invalid_media_type, msg));
        }

        std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

        bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
            return lhs.size() == rhs.size()
                && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                       return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
                   });
        }

        std::vector<std::string> split_uris(std::string_view list) {
            std::vector<std::string> out;
            std::size_t i = 0;
            while (i < list.size()) {
                while (i < list.size() && list[i] == ' ') i++;
                std::size_t start = i;
                while (i < list.size() && list[i] != ' ') i++;
                if (i > start) out.emplace_back(list.substr(start, i - start));
            }
            return out;
        }

        std::string join_uris(const std::vector<std::string>& uris) {
            std::string out;
            for (const auto& uri : uris) {
                if (!out.empty()) out += ' ';
                out += uri;
            }
            return out;
        }

        // Splits on ';' outside quoted strings. Returns false on an unterminated quote.
        bool split_params(std::string_view text, std::vector<std::string_view>& out) {
            bool quoted = false;
            std::size_t start = 0;
            for (std::size_t i = 0; i < text.size(); i++) {
                if (text[i] == '"') quoted = !quoted;
                else if (text[i] == '\\' && quoted) i++;
                else if (text[i] == ';' && !quoted) {
                    out.push_back(text.substr(start, i - start));
                    start = i + 1;
                }
            }
            if (quoted) return false;
            out.push_back(text.substr(start));
            return true;
        }

        std::string unquote(std::string_view v) {
            if (v.size() < 2 || v.front() != '"' || v.back() != '"') return std::string{ v };
            v = v.substr(1, v.size() - 2);
            std::string out;
            out.reserve(v.size());
            for (std::size_t i = 0; i < v.size(); i++) {
                if (v[i] == '\\' && i + 1 < v.size()) i++;
                out += v[i];
            }
            return out;
        }
    } // namespace

    std::string MediaType::to_string() const {
        std::string out{ media_type_name };
        if (!ext.empty()) {
            out += "; ext=\"";
            out += join_uris(ext);
            out += '"';
        }
        if (!profile.empty()) {
            out += "; profile=\"";
            out += join_uris(profile);
            out += '"';
        }
        if (quality) {
            std::array<char, 32> buf{};
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), *quality);
            if (ec == std::errc{}) {
                out += "; q=";
                out.append(buf.data(), ptr);
            }
        }
        return out;
    }

    std::expected<MediaType, DecodeError> parse_media_type(std::string_view text) {
        std::vector<std::string_view> parts;
        if (!split_params(text, parts)) return invalid("unterminated quoted parameter value");

        if (!iequals(trim(parts.front()), media_type_name)) return invalid("not the JSON:API media type");

        MediaType out;
        for (std::size_t i = 1; i < parts.size(); i++) {
            std::string_view param = trim(parts[i]);
            auto eq = param.find('=');
            if (eq == std::string_view::npos) return invalid("media type parameter has no value");

            std::string_view name = trim(param.substr(0, eq));
            std::string raw = unquote(trim(param.substr(eq + 1)));

            if (iequals(name, "ext")) {
                out.ext = split_uris(raw);
            } else if (iequals(name, "profile")) {
                out.profile = split_uris(raw);
            } else if (iequals(name, "q")) {
                double q{};
                auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), q);
                if (ec != std::errc{} || ptr != raw.data() + raw.size() || q < 0.0 || q > 1.0) {
                    return invalid("quality must be a number between 0 and 1");
                }
                out.quality = q;
            } else {
                return invalid("only ext, profile and q parameters are allowed");
            }
        }
        return out;
    }

} // namespace JsonApi
