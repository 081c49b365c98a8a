// Buffer lifecycle controller tests, driven through the headless host
#include <boost/ut.hpp>
#include "arbor/lifecycle.hpp"
#include "arbor/navigation.hpp"
#include "arbor/notifications.hpp"
#include "arbor/view.hpp"
#include "arbor/view_state.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace boost::ut;
using namespace arbor;

namespace fs = std::filesystem;

static std::size_t count_level(const test::Harness& h, spdlog::level::level_enum level) {
    std::size_t n = 0;
    for (const auto& note : h.host->notifications()) {
        if (note.level == level) ++n;
    }
    return n;
}

suite lifecycle_load_tests = [] {
    "directory_buffer_loads_and_renders"_test = [] {
        auto h = test::make_harness();
        expect(h.engine != nullptr) << "engine setup failed";
        if (!h.engine) return;

        BufferId buf = h.open("fake:///");
        auto lifecycle = h.engine->lifecycle();
        expect(lifecycle->state(buf) == BufferState::LoadedDirectory) << to_string(lifecycle->state(buf));
        expect(lifecycle->generation(buf) == 1_ull);
        expect(h.host->filetype(buf) == FILETYPE);
        expect(h.host->buftype(buf) == "acwrite");
        expect(!h.host->modified(buf));

        auto lines = h.host->get_lines(buf);
        expect(lines == std::vector<std::string>{"/001 a/", "/003 c/", "/002 b.txt"}) << "directories first";
        expect(lifecycle->is_engine_buffer(buf));
    };

    "file_buffer_reads_through_the_adapter"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open("fake:///b.txt");
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedFile);
        expect(h.host->get_lines(buf) == std::vector<std::string>{"hello", "world"});
        expect(h.host->buftype(buf) == "acwrite");
        expect(h.host->filetype(buf) != FILETYPE);
        expect(!h.host->modified(buf));
    };

    "normalize_rebinds_the_buffer_name"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open("fake:///a");
        expect(h.host->buffer_name(buf) == "fake:///a/") << h.host->buffer_name(buf);
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedDirectory);
        expect(h.line_of(buf, "inner.txt") == 1_i);
    };

    "normalize_onto_an_existing_buffer_reuses_it"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId existing = h.open("fake:///a/");
        h.open("notes.txt");

        auto res = h.host->edit(h.host->current_window(), "fake:///a", false);
        expect(res.has_value());
        BufferId temp = *res;
        h.drain();

        expect(h.current_buffer() == existing) << "window switched to the existing buffer";
        expect(!h.host->buffer_valid(temp)) << "duplicate buffer deleted";
        expect(h.engine->lifecycle()->state(temp) == BufferState::Closed);
    };

    "alias_is_rewritten_to_canonical"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open("alias:///a/");
        expect(h.host->buffer_name(buf) == "fake:///a/") << h.host->buffer_name(buf);
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedDirectory);
        expect(h.fake->normalize_calls == 1_i) << "alias rewrite happens before normalize";
    };

    "normalize_failure_is_notified"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        h.fake->fail_normalize = true;
        BufferId buf = h.open("fake:///a/");
        expect(h.engine->lifecycle()->state(buf) == BufferState::Unbound);
        expect(count_level(h, spdlog::level::err) == 1_ul);
        expect(h.engine->notifications()->size() == 1_ul);
    };

    "list_failure_on_first_load_is_notified"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        h.fake->fail_list = true;
        BufferId buf = h.open("fake:///a/");
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedDirectory) << to_string(h.engine->lifecycle()->state(buf));
        expect(h.host->filetype(buf) == FILETYPE);
        expect(count_level(h, spdlog::level::err) == 1_ul);
        expect(h.host->notifications().front().message.find("fake:///a/") != std::string::npos);
    };

    "unknown_scheme_is_left_alone"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open("http://example.com/");
        expect(h.engine->lifecycle()->state(buf) == BufferState::Unbound);
        expect(!h.engine->lifecycle()->is_engine_buffer(buf));
        expect(h.host->notifications().empty());
    };
};

suite lifecycle_stale_tests = [] {
    "callback_for_a_wiped_buffer_is_dropped"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        h.fake->hold = true;
        BufferId buf = h.open("fake:///a/");
        expect(h.engine->lifecycle()->state(buf) == BufferState::Resolving);

        h.host->delete_buffer(buf);
        expect(h.engine->lifecycle()->state(buf) == BufferState::Closed);
        expect(h.engine->lifecycle()->generation(buf) == 0_ull) << "slot dropped on wipeout";

        h.fake->hold = false;
        h.fake->release();
        h.drain();
        expect(h.fake->list_calls == 0_i) << "no render for a dead buffer";
        expect(h.host->notifications().empty());
    };

    "older_generation_is_ignored"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        h.fake->hold = true;
        BufferId buf = h.open("fake:///a/");
        auto res = h.engine->lifecycle()->load_buffer(buf);
        expect(res.has_value());
        expect(h.engine->lifecycle()->generation(buf) == 2_ull);

        h.fake->hold = false;
        h.fake->release();
        h.drain();
        expect(h.fake->normalize_calls == 2_i);
        expect(h.fake->list_calls == 1_i) << "only the latest load renders";
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedDirectory);
    };
};

suite lifecycle_write_tests = [] {
    "directory_write_goes_through_the_mutator"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        int write_post = 0;
        expect(h.dispatcher->register_event_handler(events::BUFFER_WRITE_POST, [&](const Dict&) -> Result<void> {
            ++write_post;
            return Ok();
        }).has_value());

        BufferId buf = h.open("fake:///");
        h.host->edit_lines(buf, {"/001 a/", "new_dir/"});
        expect(h.engine->lifecycle()->state(buf) == BufferState::Modified);

        expect(h.host->write(buf).has_value());
        h.drain();
        expect(h.mutator->calls == 1_i);
        expect(!h.mutator->last_confirm.has_value());
        expect(!h.host->modified(buf));
        expect(write_post == 1_i);
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedDirectory);
    };

    "failed_write_leaves_the_buffer_modified"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        int write_post = 0;
        expect(h.dispatcher->register_event_handler(events::BUFFER_WRITE_POST, [&](const Dict&) -> Result<void> {
            ++write_post;
            return Ok();
        }).has_value());

        BufferId buf = h.open("fake:///");
        h.host->edit_lines(buf, {"/001 a/", "new_dir/"});
        h.mutator->fail = true;
        expect(h.host->write(buf).has_value());
        h.drain();

        expect(h.host->modified(buf)) << "still modified after a failed save";
        expect(h.engine->lifecycle()->state(buf) == BufferState::Modified);
        expect(write_post == 0_i);
        expect(count_level(h, spdlog::level::err) == 1_ul);
    };

    "write_without_mutator_is_an_error"_test = [] {
        auto h = test::make_harness(test::FAKE_YAML, false);
        if (!h.engine) return;
        BufferId buf = h.open("fake:///");
        h.host->edit_lines(buf, {"x"});
        expect(h.host->write(buf).has_value());
        h.drain();
        expect(h.host->modified(buf));
        expect(count_level(h, spdlog::level::err) == 1_ul);
    };

    "file_write_goes_to_the_adapter"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open("fake:///b.txt");
        h.host->edit_lines(buf, {"changed"});
        expect(h.host->write(buf).has_value());
        h.drain();
        expect(h.fake->files["/b.txt"] == std::vector<std::string>{"changed"});
        expect(!h.host->modified(buf));
        expect(h.mutator->calls == 0_i);
    };

    "failed_file_write_stays_modified"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open("fake:///b.txt");
        h.host->edit_lines(buf, {"changed"});
        h.fake->fail_write = true;
        expect(h.host->write(buf).has_value());
        h.drain();
        expect(h.host->modified(buf));
        expect(h.engine->lifecycle()->state(buf) == BufferState::Modified);
        expect(count_level(h, spdlog::level::err) == 1_ul);
    };

    "discard_rerenders_modified_buffers"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId root = h.open("fake:///");
        auto original = h.host->get_lines(root);
        BufferId sub = h.open("fake:///a/");
        h.host->edit_lines(root, {"garbage"});
        int lists_before = h.fake->list_calls;

        h.engine->lifecycle()->discard_all_changes();
        h.drain();
        expect(h.host->get_lines(root) == original);
        expect(!h.host->modified(root));
        expect(h.fake->list_calls == lists_before + 1) << "unmodified buffers are not re-listed";
        expect(h.host->buffer_valid(sub));
    };

    "discard_reports_each_failed_rerender"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId root = h.open("fake:///");
        BufferId sub = h.open("fake:///a/");
        h.host->edit_lines(root, {"garbage"});
        h.host->edit_lines(sub, {"more garbage"});
        h.fake->fail_list = true;

        h.engine->lifecycle()->discard_all_changes();
        h.drain();
        expect(count_level(h, spdlog::level::err) == 2_ul) << "one notification per buffer";
        expect(h.host->modified(root));
        expect(h.host->modified(sub));
        expect(h.host->get_lines(root) == std::vector<std::string>{"garbage"});
    };
};

suite lifecycle_window_tests = [] {
    "hijack_plain_directory_path"_test = [] {
        fs::path dir = fs::temp_directory_path() / ("arbor-hijack-" + std::to_string(::getpid()));
        fs::create_directories(dir);
        std::ofstream(dir / "file.txt") << "x\n";

        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId buf = h.open(dir.string());
        std::string expected = "arbor://" + dir.string() + "/";
        expect(h.host->buffer_name(buf) == expected) << h.host->buffer_name(buf);
        expect(h.engine->lifecycle()->state(buf) == BufferState::LoadedDirectory);
        expect(h.line_of(buf, " file.txt") == 1_i);

        fs::remove_all(dir);
    };

    "hijack_can_be_disabled"_test = [] {
        fs::path dir = fs::temp_directory_path() / ("arbor-nohijack-" + std::to_string(::getpid()));
        fs::create_directories(dir);

        auto h = test::make_harness(std::string(test::FAKE_YAML) + "default-file-explorer: false\n");
        if (!h.engine) return;
        BufferId buf = h.open(dir.string());
        expect(h.host->buffer_name(buf) == dir.string());
        expect(h.engine->lifecycle()->state(buf) == BufferState::Unbound);

        fs::remove_all(dir);
    };

    "alternate_buffer_is_restored_after_leaving"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        WindowId win = h.host->current_window();
        BufferId e = h.open("e.txt");
        BufferId f = h.open("f.txt");
        expect(h.host->alternate_buffer(win) == e);

        expect(h.engine->navigator()->open("fake:///").has_value());
        h.drain();
        BufferId dir = h.current_buffer();
        expect(h.host->alternate_buffer(win) == e) << "keepalt while entering";
        const auto* record = h.engine->view_state()->find(win);
        expect(record != nullptr && record->did_enter);
        expect(record != nullptr && record->original_buffer == f);
        expect(get_as<bool>(h.host->window_option(win, "wrap")) == std::optional<bool>(false));

        BufferId g = h.open("g.txt");
        expect(h.current_buffer() == g);
        expect(h.host->alternate_buffer(win) == f) << "alternate points at where we came from, not the directory";
        expect(!h.engine->view_state()->find(win)->did_enter);
        expect(!h.host->window_option(win, "wrap").has_value()) << "window options restored";
        expect(h.host->buffer_valid(dir));
    };

    "returning_to_the_original_buffer_restores_its_alternate"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        WindowId win = h.host->current_window();
        BufferId e = h.open("e.txt");
        h.open("f.txt");
        expect(h.engine->navigator()->open("fake:///").has_value());
        h.drain();

        h.open("f.txt");
        expect(h.host->alternate_buffer(win) == e);
    };

    "split_inherits_view_state"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        WindowId win = h.host->current_window();
        h.open("e.txt");
        BufferId f = h.open("f.txt");
        expect(h.engine->navigator()->open("fake:///").has_value());
        h.drain();

        auto split = h.host->split_window(win, true, SplitModifier::BelowRight);
        expect(split.has_value());
        if (!split) return;
        h.drain();

        const auto* record = h.engine->view_state()->find(*split);
        expect(record != nullptr) << "split window has a record";
        if (!record) return;
        expect(record->did_enter);
        expect(record->original_buffer == f);
        expect(get_as<bool>(h.host->window_option(*split, "wrap")) == std::optional<bool>(false));

        h.open("g.txt");
        expect(h.host->alternate_buffer(*split) == f) << "split restores the parent's original buffer";
    };

    "closed_window_drops_its_record"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        WindowId win = h.host->current_window();
        h.open("fake:///");
        auto split = h.host->split_window(win, false, SplitModifier::BelowRight);
        expect(split.has_value());
        if (!split) return;
        h.drain();
        expect(h.engine->view_state()->find(*split) != nullptr);
        expect(h.host->close_window(*split).has_value());
        expect(h.engine->view_state()->find(*split) == nullptr);
    };

    "session_restore_loads_engine_buffers"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        expect(h.host->load_session({"fake:///a/", "fake:///b.txt", "plain.txt"}).has_value());
        h.drain();

        BufferId dir = h.host->find_buffer("fake:///a/");
        BufferId file = h.host->find_buffer("fake:///b.txt");
        expect(h.engine->lifecycle()->state(dir) == BufferState::LoadedDirectory);
        expect(h.line_of(dir, "inner.txt") == 1_i);
        expect(h.engine->lifecycle()->state(file) == BufferState::LoadedFile);
        expect(h.host->get_lines(file) == std::vector<std::string>{"hello", "world"});
        expect(h.engine->lifecycle()->state(h.host->find_buffer("plain.txt")) == BufferState::Unbound);
    };

    "scp_warning_fires_once"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        h.open("scp://host/one");
        h.open("scp://host/two");
        expect(count_level(h, spdlog::level::warn) == 1_ul);
        expect(h.host->notifications().front().message.find("fake://") != std::string::npos);
    };

    "scp_warning_can_be_silenced"_test = [] {
        auto h = test::make_harness(std::string(test::FAKE_YAML) + "silence-scp-warning: true\n");
        if (!h.engine) return;
        h.open("scp://host/one");
        expect(count_level(h, spdlog::level::warn) == 0_ul);
    };

    "netrw_hint_fires_once"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        BufferId one = h.open("/srv/one");
        h.host->set_filetype(one, "netrw");
        BufferId two = h.open("/srv/two");
        h.host->set_filetype(two, "netrw");
        expect(count_level(h, spdlog::level::warn) == 1_ul);
        expect(h.host->notifications().front().message.find("silence-netrw-warning") != std::string::npos);
    };

    "netrw_hint_can_be_silenced"_test = [] {
        auto h = test::make_harness(std::string(test::FAKE_YAML) + "silence-netrw-warning: true\n");
        if (!h.engine) return;
        BufferId one = h.open("/srv/one");
        h.host->set_filetype(one, "netrw");
        expect(count_level(h, spdlog::level::warn) == 0_ul);
    };
};

int main() {
    return 0;
}
