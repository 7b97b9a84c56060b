#include "stream_renderer.hpp"
#include "config.hpp"
#include "output_sink.hpp"
#include "verbose.hpp"

#include <utility>

namespace mdstream {

namespace {
    std::string strip_trailing_newlines(std::string s) {
        while (!s.empty() && s.back() == '\n') {
            s.pop_back();
        }
        return s;
    }
}

std::string normalize_tabs(const std::string& markdown) {
    std::string result;
    result.reserve(markdown.size());
    for (char c : markdown) {
        if (c == '\t') {
            result.append(config::TAB_WIDTH, ' ');
        } else {
            result += c;
        }
    }
    return result;
}

std::string collapse_newlines(const std::string& rendered) {
    std::string result;
    result.reserve(rendered.size());
    int run = 0;
    for (char c : rendered) {
        if (c == '\n') {
            run++;
            if (run > 2) {
                continue;
            }
        } else {
            run = 0;
        }
        result += c;
    }
    return result;
}

int wrap_width_for(int terminal_width) {
    if (terminal_width <= 0) {
        return config::DEFAULT_WRAP_WIDTH;
    }
    // One column of margin so a full-width row never triggers a wrap
    return terminal_width > 1 ? terminal_width - 1 : 1;
}

StreamRenderer::StreamRenderer(OutputSink& output, RenderStyle style, StreamOptions options)
    : output_(output)
    , style_(std::move(style))
    , options_(options)
    , renderer_(std::make_unique<DocumentRenderer>(style_, wrap_width_for(options.terminal_width)))
    , reconciler_(output)
    , preview_(output, options.terminal_width)
    , preview_enabled_(options.partial_preview && options.terminal_width > 0)
{
    verbose_log("stream", "renderer ready: style=" + style_.name +
                " width=" + std::to_string(options_.terminal_width) +
                " preview=" + (preview_enabled() ? "on" : "off"));
}

bool StreamRenderer::preview_enabled() const {
    return preview_enabled_;
}

size_t StreamRenderer::write(const std::string& data) {
    verbose_in("stream", escape_control(data));
    line_buf_ += data;

    // Process complete lines
    size_t nl;
    while ((nl = line_buf_.find('\n')) != std::string::npos) {
        std::string line = line_buf_.substr(0, nl + 1);
        line_buf_.erase(0, nl + 1);
        process_line(line);
    }

    if (preview_enabled() && (!machine_.pending_lines().empty() || !line_buf_.empty())) {
        render_partial_block();
    }

    return data.size();
}

void StreamRenderer::process_line(const std::string& raw_line) {
    BlockState before = machine_.state();
    std::vector<Commit> commits = machine_.feed_line(raw_line);
    if (machine_.state() != before) {
        verbose_log("stream", std::string(block_state_name(before)) + " -> " +
                    block_state_name(machine_.state()));
    }
    apply_commits(commits);
}

void StreamRenderer::apply_commits(const std::vector<Commit>& commits) {
    bool render = false;
    for (const auto& commit : commits) {
        committed_ += commit.markdown;
        render = render || commit.render;
        if (commit.render) {
            verbose_log("stream", "commit " + std::to_string(commit.markdown.size()) + " bytes: " +
                        escape_control(commit.markdown, 80));
        }
    }
    if (render) {
        emit_rendered();
    }
}

std::string StreamRenderer::render_document() const {
    return collapse_newlines(renderer_->render(normalize_tabs(committed_)));
}

void StreamRenderer::emit_rendered() {
    // Committed output never includes preview bytes
    if (preview_enabled()) {
        preview_.clear();
    }

    if (committed_.empty()) {
        return;
    }

    // Trailing newlines are left out: they change as more blocks arrive
    reconciler_.apply(strip_trailing_newlines(render_document()), false);
}

void StreamRenderer::flush() {
    if (preview_enabled()) {
        preview_.clear();
    }

    std::string tail = std::move(line_buf_);
    line_buf_.clear();
    std::vector<Commit> commits = machine_.finish(tail);
    for (const auto& commit : commits) {
        committed_ += commit.markdown;
    }

    if (committed_.empty()) {
        return;
    }

    verbose_log("stream", "flush: " + std::to_string(committed_.size()) + " bytes committed");
    reconciler_.apply(render_document(), true);
}

void StreamRenderer::close() {
    flush();
}

void StreamRenderer::resize(int width) {
    if (width <= 0) {
        return;
    }

    verbose_log("stream", "resize to " + std::to_string(width) + " columns");

    // Build the new renderer first so a failure leaves the old state intact
    auto renderer = std::make_unique<DocumentRenderer>(style_, wrap_width_for(width));
    renderer_ = std::move(renderer);
    options_.terminal_width = width;
    preview_.set_width(width);
    preview_.discard();

    // The old layout no longer matches the width; start from an empty sink
    if (output_.supports_reset()) {
        output_.reset();
    }
    reconciler_.reset();

    if (committed_.empty()) {
        return;
    }

    std::string snapshot = strip_trailing_newlines(render_document());
    if (!snapshot.empty()) {
        reconciler_.apply(snapshot, true);
    }
}

std::string StreamRenderer::pending_markdown() const {
    std::string content;
    for (const auto& line : machine_.pending_lines()) {
        content += line;
    }
    content += line_buf_;
    return content;
}

std::string StreamRenderer::first_pending_line() const {
    std::string content = pending_markdown();
    size_t nl = content.find('\n');
    std::string first = content.substr(0, nl);
    if (!first.empty() && first.back() == '\r') {
        first.pop_back();
    }
    return trim_left(first);
}

bool StreamRenderer::pending_is_table() const {
    if (machine_.state() == BlockState::InTable) {
        return true;
    }
    // Only pipe-first rows count; prose may contain a pipe
    std::string first = first_pending_line();
    return !first.empty() && first[0] == '|';
}

bool StreamRenderer::pending_is_list() const {
    if (machine_.state() == BlockState::InList) {
        return true;
    }

    std::string first = first_pending_line();
    if (first.empty()) {
        return false;
    }
    if (is_list_marker(first)) {
        return true;
    }
    // A lone "*" is more likely emphasis on its way in, so it does not count
    return is_ordered_list_marker_prefix(first) || first == "-" || first == "+";
}

std::string StreamRenderer::preview_anchor() const {
    const std::string& rendered = reconciler_.last_rendered();
    size_t nl = rendered.rfind('\n');
    return (nl == std::string::npos) ? rendered : rendered.substr(nl + 1);
}

std::string StreamRenderer::preview_separator() const {
    if (reconciler_.last_rendered().empty()) {
        return "";
    }
    // A list continuing a committed list renders without a blank line
    bool continues_list = pending_is_list() &&
        committed_.size() >= 1 && committed_.back() == '\n' &&
        (committed_.size() < 2 || committed_.compare(committed_.size() - 2, 2, "\n\n") != 0);
    return continues_list ? "\n" : "\n\n";
}

void StreamRenderer::render_partial_block() {
    preview_.update(pending_markdown(), *renderer_, preview_anchor(), preview_separator());
}

} // namespace mdstream
