#pragma once

#include <cstddef>
#include <string>

namespace pushscribe {

// Edit to apply at the cursor: delete `delete_count` characters backward,
// then insert `insert_text`.
struct StreamEdit {
    size_t delete_count = 0;
    std::string insert_text;

    bool empty() const { return delete_count == 0 && insert_text.empty(); }
};

// Reconcile a new partial hypothesis against what was last committed.
// A hypothesis that extends the last one inserts only the new suffix
// (leading whitespace trimmed, one trailing space appended). Anything else
// deletes the previous commit plus its trailing space and retypes the whole
// hypothesis. Counts are in code points.
StreamEdit reconcile(const std::string& new_text, const std::string& last_committed);

// Holds the last committed hypothesis of one streaming session
class StreamReconciler {
public:
    void reset() { last_committed_.clear(); }

    // Returns the edit for `new_text` and commits it. An extension that adds
    // nothing but whitespace is a no-op and leaves the commit unchanged.
    StreamEdit update(const std::string& new_text);

    const std::string& last_committed() const { return last_committed_; }

private:
    std::string last_committed_;
};

} // namespace pushscribe
