#pragma once

/**
 * Incremental streaming markdown renderer.
 *
 * Accepts markdown in arbitrary chunks (as tokens arrive from a model),
 * splits it into lines, and runs every complete line through the block state
 * machine. Whenever a block closes, the whole committed document is rendered
 * again and reconciled with what the sink already shows, so the final output
 * is byte-identical to rendering the complete document in one go, no matter
 * how the input was chunked.
 *
 * Usage:
 *   BufferSink sink;
 *   StreamRenderer renderer(sink, dark_style());
 *   renderer.write("# Ti");
 *   renderer.write("tle\n\nBody\n");
 *   renderer.close();
 */

#include "block_machine.hpp"
#include "document_renderer.hpp"
#include "partial_preview.hpp"
#include "snapshot_reconciler.hpp"

#include <memory>
#include <string>

namespace mdstream {

class OutputSink;

struct StreamOptions {
    // Show the safe prefix of the open block before it is committed.
    // Needs terminal_width > 0, since erasing it relies on cursor control.
    bool partial_preview = false;

    // Terminal width in columns. 0 = unknown: wrap at the default width and
    // keep the partial preview off, even after a later resize.
    int terminal_width = 0;
};

class StreamRenderer {
public:
    /**
     * @throws RenderError if the document renderer cannot be built.
     */
    StreamRenderer(OutputSink& output, RenderStyle style, StreamOptions options = StreamOptions());

    /**
     * Feed a chunk of markdown. Complete lines are processed immediately;
     * the unterminated remainder waits for more input or flush().
     *
     * @return Number of bytes accepted (always data.size()).
     * @throws RenderError, NonResettableWriterError
     */
    size_t write(const std::string& data);

    /**
     * Close any open block (an unterminated last line gets a newline) and do
     * a final render including trailing newlines, rewriting the sink if
     * anything already written changed.
     */
    void flush();

    // Same as flush().
    void close();

    /**
     * Re-render everything for a new terminal width. Widths <= 0 are ignored.
     * A resettable sink is reset first; with any other sink the caller must
     * clear what was shown before calling this.
     */
    void resize(int width);

    // Raw markdown bytes committed as complete blocks.
    size_t committed_markdown_len() const { return committed_.size(); }

    // Markdown of the open block: pending lines plus the unterminated tail.
    std::string pending_markdown() const;

    // True if the open block is a table, or starts with a '|' row.
    bool pending_is_table() const;

    // True if the open block is a list, or starts with a list marker
    // (including a bare "1.", "-" or "+" that is still streaming in).
    bool pending_is_list() const;

    BlockState state() const { return machine_.state(); }
    const StreamOptions& options() const { return options_; }

    // Rendered snapshot the sink currently reflects.
    const std::string& rendered() const { return reconciler_.last_rendered(); }

private:
    OutputSink& output_;
    RenderStyle style_;
    StreamOptions options_;
    std::unique_ptr<DocumentRenderer> renderer_;
    BlockMachine machine_;
    SnapshotReconciler reconciler_;
    PartialPreview preview_;

    bool preview_enabled_;   // Decided at construction; resize never changes it

    std::string line_buf_;   // Unterminated tail of the input
    std::string committed_;  // Raw markdown of all closed blocks

    bool preview_enabled() const;
    void process_line(const std::string& raw_line);
    void apply_commits(const std::vector<Commit>& commits);
    void emit_rendered();
    std::string render_document() const;
    void render_partial_block();
    std::string first_pending_line() const;
    std::string preview_anchor() const;
    std::string preview_separator() const;
};

/**
 * Replace each tab with spaces.
 */
std::string normalize_tabs(const std::string& markdown);

/**
 * Collapse every run of three or more newlines into exactly two.
 */
std::string collapse_newlines(const std::string& rendered);

// Width paragraphs wrap at for a terminal of the given width.
int wrap_width_for(int terminal_width);

} // namespace mdstream
