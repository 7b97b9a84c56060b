#pragma once

/**
 * Reconciles successive full renders of a growing document with what has
 * already been written to an output sink.
 *
 * Re-rendering the whole document after every block keeps the output
 * identical to a one-shot render, but bytes already on the sink cannot be
 * unwritten cheaply. The reconciler writes only what is new when a snapshot
 * extends the previous one and falls back to resetting the sink when an
 * earlier byte changed.
 */

#include <string>

namespace mdstream {

class OutputSink;

class SnapshotReconciler {
public:
    explicit SnapshotReconciler(OutputSink& output);

    /**
     * Bring the sink in line with a new rendered snapshot.
     *
     * - identical to the last snapshot: nothing is written
     * - extends the last snapshot: only the new suffix is written
     * - changes an earlier byte: the sink is reset and the snapshot written
     *   in full when allow_rewrite is set or the snapshot got shorter;
     *   otherwise only the bytes past the old length are written, and the
     *   sink is marked stale until the next rewrite
     *
     * @throws NonResettableWriterError if an earlier byte changed and the
     *         sink cannot be reset.
     */
    void apply(const std::string& snapshot, bool allow_rewrite);

    // Forget the emitted state after the caller rewrote the screen itself.
    void reset();

    const std::string& last_rendered() const { return last_rendered_; }
    size_t rendered_len() const { return rendered_len_; }

    // True if the sink shows outdated bytes before rendered_len().
    bool stale() const { return stale_; }

private:
    OutputSink& output_;
    std::string last_rendered_;  // Snapshot the sink currently reflects
    size_t rendered_len_ = 0;    // Bytes of last_rendered_ on the sink
    bool stale_ = false;
};

} // namespace mdstream
