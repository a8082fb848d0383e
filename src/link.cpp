#include "jsonapi/link.hpp"


namespace JsonApi {

    namespace {
        [[nodiscard]] bool absent(const std::optional<std::string>& s) noexcept {
            return !s || s->empty();
        }

        std::unexpected<DecodeError> malformed(std::string_view msg) {
            return std::unexpected(DecodeError::make(DecodeError::code::malformed_link, msg));
        }

        std::expected<Link, DecodeError> read_link_object(const value& v) {
            auto obj = ObjectReader::open(v);
            if (!obj) return std::unexpected(std::move(obj.error()));

            Link link;
            std::optional<std::string> href;
            if (auto s = obj->optional("href", href); !s) return std::unexpected(std::move(s.error()));
            if (auto s = obj->optional("rel", link.rel); !s) return std::unexpected(std::move(s.error()));
            if (const value* nested = obj->take("describedby")) {
                auto described = read_link(*nested);
                if (!described) return std::unexpected(std::move(described.error().within("describedby")));
                if (*described) link.describedby = std::make_unique<Link>(std::move(**described));
            }
            if (auto s = obj->optional("title", link.title); !s) return std::unexpected(std::move(s.error()));
            if (auto s = obj->optional("type", link.type); !s) return std::unexpected(std::move(s.error()));
            if (auto s = obj->optional("hreflang", link.hreflang); !s) return std::unexpected(std::move(s.error()));
            if (auto s = obj->optional_object("meta", link.meta); !s) return std::unexpected(std::move(s.error()));

            if (!href) return malformed("href is required for link objects");
            link.href = std::move(*href);
            return link;
        }
    } // namespace

    Link::Link(std::string target)
        : href{ std::move(target) } {}

    Link::Link(const Link& other)
        : href{ other.href },
          rel{ other.rel },
          describedby{ other.describedby ? std::make_unique<Link>(*other.describedby) : nullptr },
          title{ other.title },
          type{ other.type },
          hreflang{ other.hreflang },
          meta{ other.meta } {}

    Link& Link::operator=(const Link& other) {
        if (this == &other) return *this;
        Link copy{ other };
        *this = std::move(copy);
        return *this;
    }

    bool Link::is_compact() const noexcept {
        return !href.empty()
            && absent(rel)
            && !describedby
            && absent(title)
            && absent(type)
            && absent(hreflang)
            && !meta;
    }

    bool operator==(const Link& lhs, const Link& rhs) {
        if (static_cast<bool>(lhs.describedby) != static_cast<bool>(rhs.describedby)) return false;
        if (lhs.describedby && !(*lhs.describedby == *rhs.describedby)) return false;
        return lhs.href == rhs.href
            && lhs.rel == rhs.rel
            && lhs.title == rhs.title
            && lhs.type == rhs.type
            && lhs.hreflang == rhs.hreflang
            && lhs.meta == rhs.meta;
    }

    std::expected<std::optional<Link>, DecodeError> read_link(const value& v) {
        switch (v.type()) {
        case kind::null:
            return std::optional<Link>{};
        case kind::string:
            return std::optional<Link>{ Link{ to_std_string(v.as_string()) } };
        case kind::object: {
            auto link = read_link_object(v);
            if (!link) return std::unexpected(std::move(link.error()));
            return std::optional<Link>{ std::move(*link) };
        }
        default:
            return malformed("link must be a string or object");
        }
    }

    value write_link(const Link& link, std::pmr::memory_resource* res) {
        if (link.is_compact()) return value{ std::string_view{ link.href }, res };

        value out{ object{ allocator_type(res) }, res };
        ObjectWriter writer{ out };
        if (!link.href.empty()) writer.field("href", link.href);
        if (!absent(link.rel)) writer.field("rel", *link.rel);
        if (link.describedby) out["describedby"] = write_link(*link.describedby, res);
        if (!absent(link.title)) writer.field("title", *link.title);
        if (!absent(link.type)) writer.field("type", *link.type);
        if (!absent(link.hreflang)) writer.field("hreflang", *link.hreflang);
        writer.optional("meta", link.meta);
        return out;
    }

    void to_json(value& out, const Link& link) {
        out = write_link(link, out.resource());
    }

    Status from_json(const value& v, Link& out) {
        auto link = read_link(v);
        if (!link) return std::unexpected(std::move(link.error()));
        if (!*link) return malformed("link must be a string or object");
        out = std::move(**link);
        return {};
    }

    Status from_json(const value& v, Links& out) {
        if (auto s = expect_kind(v, kind::object); !s) return s;
        out.clear();
        for (const auto& [name, raw] : v.as_object()) {
            auto link = read_link(raw);
            if (!link) return std::unexpected(std::move(link.error().within(name)));
            if (*link) out.insert_or_assign(to_std_string(name), std::move(**link));
        }
        return {};
    }

} // namespace JsonApi
