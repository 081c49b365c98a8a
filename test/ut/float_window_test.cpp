// Floating window geometry and teardown tests
#include <boost/ut.hpp>
#include "arbor/float_window.hpp"
#include "arbor/view_state.hpp"
#include "test_support.hpp"

using namespace boost::ut;
using namespace arbor;

suite float_geometry_tests = [] {
    "bordered_float_is_centered"_test = [] {
        FloatConfig config;  // padding 2, rounded border
        auto g = compute_float_geometry(config, 120, 40);
        expect(g.width == 114_i) << "width " << g.width;   // 120 - 4 - 2
        expect(g.height == 34_i) << "height " << g.height; // 40 - 4 - 2
        expect(g.row == 3_i) << "row " << g.row;           // (40 - 34) / 2
        expect(g.col == 2_i) << "col " << g.col;           // (120 - 114) / 2 - 1
    };

    "borderless_float_has_no_shift"_test = [] {
        FloatConfig config;
        config.border = "none";
        auto g = compute_float_geometry(config, 120, 40);
        expect(g.width == 116_i);
        expect(g.height == 36_i);
        expect(g.row == 2_i);
        expect(g.col == 2_i);
    };

    "max_caps_apply"_test = [] {
        FloatConfig config;
        config.max_width = 80;
        config.max_height = 20;
        auto g = compute_float_geometry(config, 200, 60);
        expect(g.width == 80_i);
        expect(g.height == 20_i);
        expect(g.row == 20_i);
        expect(g.col == 59_i);
    };

    "tiny_editor_clamps_at_zero"_test = [] {
        FloatConfig config;
        config.padding = 10;
        auto g = compute_float_geometry(config, 10, 5);
        expect(g.width == 0_i);
        expect(g.height == 0_i);
        expect(g.row >= 0_i);
        expect(g.col >= 0_i);
    };
};

suite float_window_tests = [] {
    "open_shows_directory_in_a_float"_test = [] {
        auto h = test::make_harness();
        expect(h.engine != nullptr) << "engine setup failed";
        if (!h.engine) return;

        WindowId origin = h.host->current_window();
        auto res = h.engine->floats()->open("fake:///");
        expect(res.has_value()) << error_msg(res);
        if (!res) return;
        WindowId win = *res;
        h.drain();

        expect(h.host->is_floating(win));
        expect(h.host->current_window() == win);
        expect(h.host->buffer_name(h.host->window_buffer(win)) == "fake:///");
        expect(h.host->window_title(win) == "fake:///");
        expect(h.host->window_border(win) == "rounded");
        expect(get_as<int>(h.host->window_option(win, "winblend")) == std::optional<int>(10));
        expect(h.host->line_count(h.host->window_buffer(win)) == 3_i);
        expect(h.engine->floats()->active_teardowns() == 1_ul);
        expect(origin != win);
    };

    "scratch_buffer_is_wiped"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        auto before = h.host->list_buffers().size();
        auto res = h.engine->floats()->open("fake:///");
        expect(res.has_value());
        h.drain();
        // Only the directory buffer was added; the unlisted scratch buffer is gone
        expect(h.host->list_buffers().size() == before + 1) << h.host->list_buffers().size();
    };

    "leaving_to_a_normal_window_closes_the_float_once"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        WindowId origin = h.host->current_window();
        auto res = h.engine->floats()->open("fake:///");
        expect(res.has_value());
        if (!res) return;
        WindowId win = *res;
        h.drain();

        h.host->set_current_window(origin);
        expect(h.host->window_valid(win)) << "teardown waits one tick";
        h.drain();
        expect(!h.host->window_valid(win)) << "float should be closed";
        expect(h.engine->floats()->active_teardowns() == 0_ul);

        // Later leaves find no handler
        auto split = h.host->split_window(origin, false, SplitModifier::BelowRight);
        expect(split.has_value());
        h.drain();
        expect(h.engine->floats()->active_teardowns() == 0_ul);
    };

    "moving_between_floats_keeps_the_float"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        auto first = h.engine->floats()->open("fake:///");
        expect(first.has_value());
        h.drain();
        auto second = h.engine->floats()->open("fake:///a/");
        expect(second.has_value());
        h.drain();
        if (!first || !second) return;

        expect(h.host->window_valid(*first)) << "focus stayed inside a float";
        expect(h.host->window_valid(*second));
        expect(h.engine->floats()->active_teardowns() == 2_ul);
    };

    "editor_too_small_is_an_error"_test = [] {
        auto h = test::make_harness(std::string(test::FAKE_YAML) + "float:\n  padding: 100\n");
        if (!h.engine) return;
        auto res = h.engine->floats()->open("fake:///");
        expect(!res.has_value());
        expect(h.host->is_floating(h.host->current_window()) == false);
    };

    "failed_edit_closes_the_float"_test = [] {
        auto h = test::make_harness();
        if (!h.engine) return;
        auto windows = h.host->all_windows().size();
        auto res = h.engine->floats()->open("");
        expect(!res.has_value()) << "a float needs something to show";
        expect(h.host->all_windows().size() == windows) << "no float left behind";
        expect(!h.host->is_floating(h.host->current_window()));
        expect(h.engine->floats()->active_teardowns() == 0_ul);
    };
};

int main() {
    return 0;
}
