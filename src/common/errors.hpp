#pragma once

#include <stdexcept>
#include <string>

namespace tfscope {

// Transient I/O trouble inside a loader. Caught at the loader boundary and
// retried on the next poll cycle.
class IngestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A decode capability broke an index invariant (duplicate global entry,
// conflicting tag type). Fatal for the engine instance.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace tfscope
