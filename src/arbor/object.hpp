#pragma once

#include "result.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace arbor {

// Base class for long-lived engine objects with lifecycle management
class Object {
public:
    Object() : uid_(generate_uid()) {}
    virtual ~Object() = default;

    // Unique identifier, stable for the object's lifetime (used in log lines)
    const std::string& uid() const { return uid_; }

    // Lifecycle - override in subclasses
    virtual Result<void> init() { return Ok(); }
    virtual Result<void> dispose() { return Ok(); }

protected:
    std::string uid_;

private:
    static std::string generate_uid() {
        static std::atomic<std::uint64_t> counter{0};
        static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::uint64_t v = ++counter;
        std::string out;
        do {
            out.insert(out.begin(), digits[v % 36]);
            v /= 36;
        } while (v);
        return "obj-" + out;
    }
};

} // namespace arbor
