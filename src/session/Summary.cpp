#include "session/Summary.hpp"

#include <fmt/core.h>

namespace ss::session {

void Summary::record(const pipeline::CopyOutcome& outcome) {
    using Kind = pipeline::CopyOutcome::Kind;
    switch (outcome.kind) {
        case Kind::Ignored: ++ignored; break;
        case Kind::CopiedLocal: ++copied_local; break;
        case Kind::CopiedRemote: ++copied_remote; break;
        case Kind::Failed: ++failed; break;
    }
    if (outcome.converted) ++converted;
}

std::string Summary::str() const {
    return fmt::format("{} copied to volume, {} kept locally, {} converted, {} ignored, {} failed",
                       copied_remote, copied_local, converted, ignored, failed);
}

}
