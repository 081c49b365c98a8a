#pragma once

#include "adapter.hpp"
#include <memory>
#include <optional>

namespace arbor {

// Mutator - turns the edited text of every modified directory buffer into
// adapter actions and performs them. On success each affected buffer must be
// re-rendered and left unmodified.
// confirm: true = always ask, false = never ask, nullopt = ask unless the
// changes are simple and skip-confirm-for-simple-edits is set.
class Mutator {
public:
    virtual ~Mutator() = default;

    virtual void try_write_changes(std::optional<bool> confirm, DoneCallback cb) = 0;
};

using MutatorPtr = std::shared_ptr<Mutator>;

} // namespace arbor
