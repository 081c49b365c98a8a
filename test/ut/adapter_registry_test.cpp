// Adapter registry unit tests
#include <boost/ut.hpp>
#include "arbor/adapter_registry.hpp"
#include "arbor/dispatcher.hpp"
#include "test_support.hpp"

using namespace boost::ut;
using namespace arbor;

// Tests run from build directory, plugins are in ./plugins
static const char* PLUGINS_PATH = "plugins";

static std::map<std::string, std::string> default_adapters() {
    return {{"arbor://", "files"}, {"arbor-mem://", "memory"}};
}

suite adapter_registry_tests = [] {
    "files_adapter_is_builtin"_test = [] {
        auto disp = *Dispatcher::create();
        auto res = AdapterRegistry::create(disp, default_adapters(), {});
        expect(res.has_value()) << "AdapterRegistry creation failed: " << error_msg(res);
        auto registry = *res;

        expect(registry->has_factory("files"));
        auto adapter = registry->get_adapter("arbor://");
        expect(adapter != nullptr) << "no adapter for arbor://";
        expect(adapter->name() == "files");
        expect(registry->get_adapter("arbor://") == adapter) << "adapters are created once and shared";
    };

    "unknown_scheme_has_no_adapter"_test = [] {
        auto disp = *Dispatcher::create();
        auto registry = *AdapterRegistry::create(disp, default_adapters(), {});
        expect(registry->get_adapter("sftp://") == nullptr);
        expect(!registry->parse("sftp://host/dir/").has_value());
        expect(!registry->parse("/plain/path").has_value());
        expect(registry->get_adapter_for_name("/plain/path") == nullptr);
    };

    "scheme_bound_to_missing_factory_yields_null"_test = [] {
        auto disp = *Dispatcher::create();
        auto registry = *AdapterRegistry::create(disp, default_adapters(), {});
        // No plugin path: memory is unavailable
        expect(registry->is_known_scheme("arbor-mem://"));
        expect(registry->get_adapter("arbor-mem://") == nullptr);
    };

    "alias_is_transparent"_test = [] {
        auto disp = *Dispatcher::create();
        auto registry = *AdapterRegistry::create(disp, default_adapters(), {{"file://", "arbor://"}});

        expect(registry->is_known_scheme("file://"));
        expect(registry->is_alias("file://"));
        expect(!registry->is_adapter_scheme("file://"));
        expect(registry->get_adapter("file://") == registry->get_adapter("arbor://"));

        auto url = registry->parse("file:///tmp/");
        expect(url.has_value());
        auto canonical = registry->resolve_alias(*url);
        expect(canonical.to_string() == "arbor:///tmp/") << canonical.to_string();
        expect(registry->resolve_alias(canonical) == canonical) << "canonical urls are left alone";
    };

    "alias_cycles_are_rejected"_test = [] {
        auto disp = *Dispatcher::create();
        auto res = AdapterRegistry::create(disp, default_adapters(), {{"a://", "b://"}, {"b://", "a://"}});
        expect(!res.has_value()) << "alias cycle must be rejected";
    };

    "alias_to_alias_is_rejected"_test = [] {
        auto disp = *Dispatcher::create();
        auto res = AdapterRegistry::create(disp, default_adapters(), {{"a://", "b://"}, {"b://", "arbor://"}});
        expect(!res.has_value()) << "aliases must point at canonical schemes";
    };

    "alias_shadowing_a_scheme_is_rejected"_test = [] {
        auto disp = *Dispatcher::create();
        auto res = AdapterRegistry::create(disp, default_adapters(), {{"arbor-mem://", "arbor://"}});
        expect(!res.has_value());
    };

    "alias_to_unregistered_scheme_is_rejected"_test = [] {
        auto disp = *Dispatcher::create();
        auto res = AdapterRegistry::create(disp, default_adapters(), {{"x://", "nowhere://"}});
        expect(!res.has_value());
    };

    "scheme_lookups"_test = [] {
        auto disp = *Dispatcher::create();
        auto registry = *AdapterRegistry::create(disp, default_adapters(), {{"file://", "arbor://"}});
        expect(registry->scheme_for_adapter("files") == std::optional<std::string>("arbor://"));
        expect(registry->adapter_name("arbor://") == std::optional<std::string>("files"));
        expect(!registry->adapter_name("file://").has_value()) << "aliases are not adapter schemes";
        expect(registry->schemes().size() == 3_ul);
    };

    "custom_factories"_test = [] {
        auto disp = *Dispatcher::create();
        auto registry = *AdapterRegistry::create(disp, {{"fake://", "fake"}}, {});
        auto fake = std::make_shared<test::FakeAdapter>(disp);
        auto res = registry->register_factory("fake", [fake](std::shared_ptr<Dispatcher>) -> Result<AdapterPtr> {
            return fake;
        });
        expect(res.has_value()) << error_msg(res);
        expect(!registry->register_factory("fake", [fake](std::shared_ptr<Dispatcher>) -> Result<AdapterPtr> {
            return fake;
        }).has_value()) << "duplicate factory must be rejected";
        expect(registry->get_adapter("fake://") == fake);
    };

    "failing_factory_is_reported_once"_test = [] {
        auto disp = *Dispatcher::create();
        auto registry = *AdapterRegistry::create(disp, {{"bad://", "bad"}}, {});
        int calls = 0;
        expect(registry->register_factory("bad", [&calls](std::shared_ptr<Dispatcher>) -> Result<AdapterPtr> {
            ++calls;
            return Err<AdapterPtr>("backend offline");
        }).has_value());
        expect(registry->get_adapter("bad://") == nullptr);
        expect(registry->get_adapter("bad://") == nullptr);
        expect(calls == 1_i) << "factory called " << calls << " times";
    };

    "memory_plugin_loads"_test = [] {
        auto disp = *Dispatcher::create();
        auto res = AdapterRegistry::create(disp, default_adapters(), {}, PLUGINS_PATH);
        expect(res.has_value()) << error_msg(res);
        auto registry = *res;

        expect(registry->has_factory("memory")) << "memory plugin not found in ./plugins";
        auto adapter = registry->get_adapter("arbor-mem://");
        expect(adapter != nullptr);
        if (!adapter) return;
        expect(adapter->name() == "memory");
        expect(adapter->supports(Capability::GetParent));

        // Create a directory and a file, then list the root
        Action mkdir;
        mkdir.type = ActionType::Create;
        mkdir.entry_type = EntryType::Directory;
        mkdir.url = Url("arbor-mem://", "/docs/");
        bool created = false;
        adapter->perform_action(mkdir, [&](Result<void> r) { created = r.has_value(); });

        bool written = false;
        adapter->write_file(Url("arbor-mem://", "/docs/readme.txt"), {"hi"}, [&](Result<void> r) {
            written = r.has_value();
        });

        std::vector<Entry> root;
        adapter->list(Url("arbor-mem://", "/"), [&](Result<std::vector<Entry>> r) {
            if (r) root = *r;
        });
        std::vector<Entry> docs;
        adapter->list(Url("arbor-mem://", "/docs/"), [&](Result<std::vector<Entry>> r) {
            if (r) docs = *r;
        });

        expect(!created) << "callbacks wait for the dispatcher";
        disp->run_pending();
        expect(created);
        expect(written);
        expect(root.size() == 1_ul && root[0].name == "docs" && root[0].type == EntryType::Directory);
        expect(docs.size() == 1_ul && docs[0].name == "readme.txt");

        auto parent_url = adapter->get_parent(Url("arbor-mem://", "/docs/readme.txt"));
        expect(parent_url.has_value() && parent_url->to_string() == "arbor-mem:///docs/");
    };
};

int main() {
    return 0;
}
