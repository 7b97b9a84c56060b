#include "snapshot_reconciler.hpp"
#include "errors.hpp"
#include "output_sink.hpp"
#include "terminal.hpp"
#include "verbose.hpp"

namespace mdstream {

namespace {
    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }
}

SnapshotReconciler::SnapshotReconciler(OutputSink& output)
    : output_(output)
{
}

void SnapshotReconciler::apply(const std::string& snapshot, bool allow_rewrite) {
    // Bytes left behind by an earlier tail append are repaired by the next
    // rewrite, even if the snapshot itself did not change
    bool repair = stale_ && allow_rewrite;

    if (snapshot == last_rendered_ && !repair) {
        return;
    }

    // Fast path: the document only grew at the end
    if (!repair && starts_with(snapshot, last_rendered_)) {
        std::string delta = snapshot.substr(last_rendered_.size());
        verbose_out("render", "append " + std::to_string(delta.size()) + " bytes: " + escape_control(delta));
        output_.write(delta);
        last_rendered_ = snapshot;
        rendered_len_ = snapshot.size();
        return;
    }

    if (!output_.supports_reset()) {
        verbose_err("render", "prefix changed on non-resettable sink");
        throw NonResettableWriterError();
    }

    if (allow_rewrite || snapshot.size() < last_rendered_.size()) {
        verbose_out("render", "rewrite " + std::to_string(snapshot.size()) + " bytes");
        output_.reset();
        output_.write(snapshot);
        last_rendered_ = snapshot;
        rendered_len_ = snapshot.size();
        stale_ = false;
        return;
    }

    // Longer snapshot with a changed prefix: keep what is on screen and
    // append the tail, starting outside any escape sequence
    size_t start = terminal::safe_suffix_start(snapshot, last_rendered_.size());
    std::string tail = snapshot.substr(start);
    verbose_out("render", "prefix changed, append tail of " + std::to_string(tail.size()) + " bytes");
    output_.write(tail);
    last_rendered_ = snapshot;
    rendered_len_ = snapshot.size();
    stale_ = true;
}

void SnapshotReconciler::reset() {
    last_rendered_.clear();
    rendered_len_ = 0;
    stale_ = false;
}

} // namespace mdstream
