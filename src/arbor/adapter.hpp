#pragma once

#include "result.hpp"
#include "types.hpp"
#include "url.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arbor {

class Dispatcher;

// ColumnDefinition - one display column between the entry id and its name.
// parse() consumes the column's text from the front of a rendered line and
// returns the parsed value plus the remaining text.
class ColumnDefinition {
public:
    virtual ~ColumnDefinition() = default;

    virtual const std::string& name() const = 0;
    virtual std::string render(const Entry& entry) const = 0;
    virtual std::optional<std::pair<Value, std::string>> parse(std::string_view text) const = 0;
};

using ColumnPtr = std::shared_ptr<const ColumnDefinition>;

enum class ActionType { Create, Delete, Move, Copy, Change };

const char* to_string(ActionType type);

// A single mutation computed by the mutator and executed by an adapter
struct Action {
    ActionType type = ActionType::Create;
    EntryType entry_type = EntryType::File;
    Url url;        // create, delete, change
    Url src_url;    // move, copy
    Url dest_url;   // move, copy
    std::string column;  // change
    Value value;         // change
};

enum class Capability { GetParent, Actions };

using ListCallback = std::function<void(Result<std::vector<Entry>>)>;
using NormalizeCallback = std::function<void(Result<Url>)>;
using ReadFileCallback = std::function<void(Result<std::vector<std::string>>)>;
using DoneCallback = std::function<void(Result<void>)>;

// Adapter - storage backend for one scheme.
// Callbacks may fire at any later time; callers re-validate their target on resume.
// Deferred work holds the adapter weakly and fails once it is gone.
class Adapter : public std::enable_shared_from_this<Adapter> {
public:
    virtual ~Adapter() = default;

    virtual const std::string& name() const = 0;

    // Directory listing; returned entries carry no id
    virtual void list(const Url& url, ListCallback cb) = 0;
    virtual bool is_modifiable(const Url& url) const = 0;
    virtual ColumnPtr get_column(const std::string& name) const = 0;
    // Canonical form of an address (absolute, resolved, directory slash fixed)
    virtual void normalize_url(const Url& url, NormalizeCallback cb) = 0;

    virtual void read_file(const Url& url, ReadFileCallback cb) = 0;
    virtual void write_file(const Url& url, const std::vector<std::string>& lines, DoneCallback cb) = 0;

    // Optional capabilities
    virtual bool supports(Capability /*cap*/) const { return false; }
    virtual Result<Url> get_parent(const Url& url) const {
        return Err<Url>(name() + ": get_parent not supported for " + url.to_string());
    }
    virtual Result<std::string> render_action(const Action& action) const {
        return Err<std::string>(name() + ": render_action not supported for " + to_string(action.type));
    }
    virtual void perform_action(const Action& action, DoneCallback cb) {
        cb(Err<void>(name() + ": perform_action not supported for " + to_string(action.type)));
    }
    // Whether entries can be moved/copied directly to an adapter of the given name
    virtual bool supports_transfer(const std::string& other_adapter) const {
        return other_adapter == name();
    }

    // Lifecycle
    virtual Result<void> init() { return Ok(); }
    virtual Result<void> dispose() { return Ok(); }
};

using AdapterPtr = std::shared_ptr<Adapter>;

// Factory signature shared by built-in adapters and adapter plugins
using AdapterCreateFn = std::function<Result<AdapterPtr>(std::shared_ptr<Dispatcher>)>;

// Each adapter plugin .so exports these C functions:
// extern "C" const char* name();     // e.g. "memory"
// extern "C" const char* type();     // "adapter"
// extern "C" Result<AdapterPtr> create(std::shared_ptr<Dispatcher>);

} // namespace arbor
