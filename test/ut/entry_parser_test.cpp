// Entry parser and entry cache unit tests
#include <boost/ut.hpp>
#include "arbor/columns.hpp"
#include "arbor/entry_cache.hpp"
#include "arbor/entry_parser.hpp"
#include "test_support.hpp"

using namespace boost::ut;
using namespace arbor;
using arbor::test::make_entry;

static const Url ROOT("arbor://", "/project/");

static std::vector<ColumnPtr> size_columns() {
    auto size = std::make_shared<TokenColumn>("size", 1, [](const Entry& e) {
        return e.type == EntryType::Directory ? std::string("-")
                                              : format_size(get_as<std::uint64_t>(e.meta, "size").value_or(0));
    });
    return {size};
}

static Entry sized(std::string name, std::uint64_t size) {
    Entry entry = make_entry(std::move(name));
    entry.meta["size"] = size;
    return entry;
}

suite entry_cache_tests = [] {
    "ids_are_stable_across_relisting"_test = [] {
        EntryCache cache;
        auto first = cache.store_entries(ROOT, {make_entry("a.txt"), make_entry("src", EntryType::Directory)});
        expect(first.size() == 2_ul);
        expect(first[0].id.has_value() && first[1].id.has_value());
        EntryId a_id = *first[0].id;

        auto second = cache.store_entries(ROOT, {make_entry("b.txt"), make_entry("a.txt")});
        expect(second[1].id == std::optional<EntryId>(a_id)) << "a.txt kept its id";
        expect(second[0].id != std::optional<EntryId>(a_id));
        expect(!cache.get_entry_by_id(*first[1].id).has_value()) << "vanished entries drop out of the id index";
        expect(cache.list_url(ROOT).size() == 2_ul);
    };

    "parent_url_of_an_id"_test = [] {
        EntryCache cache;
        auto stored = cache.store_entries(Url("arbor://", "/project"), {make_entry("x")});
        auto parent_url = cache.get_parent_url(*stored[0].id);
        expect(parent_url.has_value() && parent_url->to_string() == "arbor:///project/");
        expect(!cache.get_parent_url(9999).has_value());
    };

    "ids_are_never_reused"_test = [] {
        EntryCache cache;
        auto one = cache.store_entries(ROOT, {make_entry("x")});
        cache.clear_url(ROOT);
        auto two = cache.store_entries(ROOT, {make_entry("x")});
        expect(*two[0].id > *one[0].id);
    };
};

suite entry_parser_tests = [] {
    "format_entry_id_pads_to_three_digits"_test = [] {
        expect(format_entry_id(7) == "/007");
        expect(format_entry_id(42) == "/042");
        expect(format_entry_id(12345) == "/12345");
    };

    "render_then_parse_returns_the_cached_entry"_test = [] {
        EntryCache cache;
        auto columns = size_columns();
        auto entries = cache.store_entries(ROOT, {
            sized("notes.txt", 2048),
            make_entry("src", EntryType::Directory),
        });

        for (const auto& entry : entries) {
            std::string line = render_entry_line(entry, columns);
            auto parsed = parse_entry(line, columns, cache);
            expect(parsed.has_value()) << "could not parse '" << line << "'";
            if (!parsed) continue;
            expect(parsed->id == entry.id) << line;
            expect(parsed->name == entry.name) << line;
            expect(parsed->type == entry.type) << line;
        }
    };

    "rendered_line_shape"_test = [] {
        EntryCache cache;
        auto entries = cache.store_entries(ROOT, {sized("notes.txt", 12), make_entry("src", EntryType::Directory)});
        expect(render_entry_line(entries[0], size_columns()) == "/001 12B notes.txt") << render_entry_line(entries[0], size_columns());
        expect(render_entry_line(entries[1], size_columns()) == "/002 - src/") << render_entry_line(entries[1], size_columns());
        expect(render_entry_line(entries[1], {}) == "/002 src/");
    };

    "typed_lines_become_new_entries"_test = [] {
        EntryCache cache;
        auto dir = parse_entry("notes/", {}, cache);
        expect(dir.has_value() && dir->name == "notes" && dir->type == EntryType::Directory && !dir->id);

        auto file = parse_entry("notes", {}, cache);
        expect(file.has_value() && file->name == "notes" && file->type == EntryType::File && !file->id);

        auto padded = parse_entry("  spaced.txt  ", {}, cache);
        expect(padded.has_value() && padded->name == "spaced.txt");

        expect(!parse_entry("   ", {}, cache).has_value()) << "blank lines are not entries";
        expect(!parse_entry("", {}, cache).has_value());
        expect(!parse_entry("/", {}, cache).has_value());
    };

    "renamed_line_keeps_id_and_takes_typed_name"_test = [] {
        EntryCache cache;
        auto entries = cache.store_entries(ROOT, {make_entry("old.txt")});
        std::string line = format_entry_id(*entries[0].id) + " new.txt";
        auto parsed = parse_entry(line, {}, cache);
        expect(parsed.has_value());
        expect(parsed->id == entries[0].id);
        expect(parsed->name == "new.txt");
    };

    "unknown_id_keeps_the_typed_name_without_id"_test = [] {
        EntryCache cache;
        auto parsed = parse_entry("/777 ghost/", {}, cache);
        expect(parsed.has_value());
        expect(parsed->name == "ghost");
        expect(parsed->type == EntryType::Directory);
        expect(!parsed->id.has_value());
    };

    "link_lines"_test = [] {
        auto parsed = parse_line("/004 current -> releases/v2/", {});
        expect(parsed.has_value());
        expect(parsed->name == "current -> releases/v2") << "the target stays until the entry is known";

        EntryCache cache;
        Entry link = make_entry("latest", EntryType::Link);
        link.meta["link"] = std::string("/opt/app");
        link.meta["link_type"] = std::string("directory");
        auto stored = cache.store_entries(ROOT, {link});
        std::string line = render_entry_line(stored[0], {});
        expect(line == "/001 latest -> /opt/app/") << line;

        auto entry = parse_entry(line, {}, cache);
        expect(entry.has_value() && entry->type == EntryType::Link && entry->is_directory_like());
        expect(entry.has_value() && entry->name == "latest");

        auto ghost = parse_entry("/777 current -> releases/v2/", {}, cache);
        expect(ghost.has_value() && ghost->name == "current" && ghost->type == EntryType::Directory);
    };

    "arrow_in_a_plain_name_survives_reparse"_test = [] {
        EntryCache cache;
        auto stored = cache.store_entries(ROOT, {
            make_entry("a -> b"),
            make_entry("x -> y", EntryType::Directory),
        });
        for (const auto& entry : stored) {
            std::string line = render_entry_line(entry, {});
            auto parsed = parse_entry(line, {}, cache);
            expect(parsed.has_value()) << line;
            if (!parsed) continue;
            expect(parsed->id == entry.id) << line;
            expect(parsed->name == entry.name) << line;
            expect(parsed->type == entry.type) << line;
        }
    };

    "column_mismatch_falls_back_to_literal"_test = [] {
        EntryCache cache;
        // Only an id and a name, but a size column is expected
        auto parsed = parse_line("/001 name", size_columns());
        expect(!parsed.has_value());
        auto entry = parse_entry("/001 name", size_columns(), cache);
        expect(entry.has_value() && entry->name == "/001 name") << "unstructured lines are taken literally";
    };

    "column_values_are_captured"_test = [] {
        auto parsed = parse_line("/010 1.5K report.pdf", size_columns());
        expect(parsed.has_value());
        expect(parsed->id == 10_ull);
        expect(parsed->name == "report.pdf");
        expect(get_as<std::string>(parsed->column_values, "size") == std::optional<std::string>("1.5K"));
    };
};

int main() {
    return 0;
}
