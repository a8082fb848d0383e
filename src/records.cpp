#include "jsonapi/records.hpp"


namespace JsonApi {

    void to_json(value& out, const ResourceIdentifier& id) {
        ObjectWriter{ out }
            .field("type", id.type)
            .optional("id", id.id)
            .optional("lid", id.lid)
            .optional("meta", id.meta);
    }

    Status from_json(const value& v, ResourceIdentifier& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->required("type", out.type); !s) return s;
        if (auto s = obj->optional("id", out.id); !s) return s;
        if (auto s = obj->optional("lid", out.lid); !s) return s;
        return obj->optional_object("meta", out.meta);
    }

    void to_json(value& out, const JsonApiInfo& info) {
        ObjectWriter{ out }
            .optional("version", info.version)
            .optional("ext", info.ext)
            .optional("profile", info.profile)
            .optional("meta", info.meta);
    }

    Status from_json(const value& v, JsonApiInfo& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->optional("version", out.version); !s) return s;
        if (auto s = obj->optional("ext", out.ext); !s) return s;
        if (auto s = obj->optional("profile", out.profile); !s) return s;
        return obj->optional_object("meta", out.meta);
    }

    bool operator==(const ErrorLinks& lhs, const ErrorLinks& rhs) {
        return lhs.about == rhs.about && lhs.type == rhs.type && same_members(lhs.extensions, rhs.extensions);
    }

    void to_json(value& out, const ErrorLinks& links) {
        ObjectWriter{ out }
            .optional("about", links.about)
            .optional("type", links.type)
            .extend(links.extensions);
    }

    Status from_json(const value& v, ErrorLinks& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->optional("about", out.about); !s) return s;
        if (auto s = obj->optional("type", out.type); !s) return s;
        out.extensions = obj->remaining();
        return {};
    }

    void to_json(value& out, const ErrorSource& source) {
        ObjectWriter{ out }
            .optional("pointer", source.pointer)
            .optional("parameter", source.parameter)
            .optional("header", source.header);
    }

    Status from_json(const value& v, ErrorSource& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->optional("pointer", out.pointer); !s) return s;
        if (auto s = obj->optional("parameter", out.parameter); !s) return s;
        return obj->optional("header", out.header);
    }

    void to_json(value& out, const ErrorObject& error) {
        ObjectWriter{ out }
            .optional("id", error.id)
            .optional("links", error.links)
            .optional("status", error.status)
            .optional("code", error.code)
            .optional("title", error.title)
            .optional("detail", error.detail)
            .optional("source", error.source)
            .optional("meta", error.meta);
    }

    Status from_json(const value& v, ErrorObject& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->optional("id", out.id); !s) return s;
        if (auto s = obj->optional("links", out.links); !s) return s;
        if (auto s = obj->optional("status", out.status); !s) return s;
        if (auto s = obj->optional("code", out.code); !s) return s;
        if (auto s = obj->optional("title", out.title); !s) return s;
        if (auto s = obj->optional("detail", out.detail); !s) return s;
        if (auto s = obj->optional("source", out.source); !s) return s;
        return obj->optional_object("meta", out.meta);
    }

} // namespace JsonApi
