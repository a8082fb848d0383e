#include <print>
#include <fstream>
#include <iostream>

#include "jsonapi/jsonapi.hpp"

namespace {

    void print_links(const JsonApi::Links& links, std::string_view indent) {
        for (const auto& [name, link] : links) {
            std::println("{}{}: {}", indent, name, link.href);
            if (link.describedby) std::println("{}  describedby: {}", indent, link.describedby->href);
        }
    }

    void print_resource(const JsonApi::Resource& r) {
        std::println("  - {} {}", r.type, r.id.value_or(r.lid.value_or("(no id)")));
        if (r.attributes) std::println("    attributes: {}", JsonApi::dump(*r.attributes));
        if (r.relationships) {
            for (const auto& [name, rel] : *r.relationships) {
                std::println("    relationship {}: {}", name, JsonApi::shape_name(rel.data.tag()));
            }
        }
        if (r.links) print_links(*r.links, "    ");
    }

    int inspect(std::istream& in) {
        auto doc = JsonApi::read_document(in);
        if (!doc) {
            std::println(stderr, "error: {}", JsonApi::describe(doc.error()));
            return 1;
        }
        if (!*doc) {
            std::println("no document");
            return 0;
        }

        const JsonApi::Document& d = **doc;
        if (d.jsonapi && d.jsonapi->version) std::println("jsonapi {}", *d.jsonapi->version);
        std::println("data: {}", JsonApi::shape_name(d.data.tag()));

        if (d.has_single_resource()) {
            auto single = d.data.single();
            if (!single) {
                std::println(stderr, "error: {}", JsonApi::describe(single.error()));
                return 1;
            }
            print_resource(**single);
        } else if (d.has_collection_resource()) {
            auto many = d.data.collection();
            if (!many) {
                std::println(stderr, "error: {}", JsonApi::describe(many.error()));
                return 1;
            }
            for (const auto& r : **many) print_resource(r);
        }

        if (d.has_errors()) {
            std::println("errors:");
            for (const auto& e : *d.errors) {
                std::println("  - {} {}: {}", e.status.value_or("???"), e.title.value_or(""), e.detail.value_or(""));
            }
        }
        if (d.links) {
            std::println("links:");
            print_links(*d.links, "  ");
        }
        if (d.included) std::println("included: {} resource(s)", d.included->size());
        for (const auto& [key, v] : d.extensions) std::println("extension {}: {}", key, JsonApi::dump(v));

        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) return inspect(std::cin);

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        std::println(stderr, "Failed to open {}", argv[1]);
        return -1;
    }
    return inspect(ifs);
}
