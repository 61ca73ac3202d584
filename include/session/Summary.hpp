#pragma once

#include "pipeline/CopyOutcome.hpp"

#include <cstddef>
#include <string>

namespace ss::session {

struct Summary {
    size_t copied_remote = 0;
    size_t copied_local = 0;
    size_t ignored = 0;
    size_t failed = 0;
    size_t converted = 0;

    void record(const pipeline::CopyOutcome& outcome);

    [[nodiscard]] size_t processed() const { return copied_remote + copied_local + failed; }
    [[nodiscard]] std::string str() const;
};

}
