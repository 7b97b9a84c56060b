#include "partial_preview.hpp"
#include "document_renderer.hpp"
#include "output_sink.hpp"
#include "verbose.hpp"

namespace mdstream {

namespace {
    // Position of the single marker c that closes an italic span opened
    // before from, skipping doubled markers. npos if there is none.
    size_t find_single_marker(const std::string& content, char c, size_t from) {
        size_t n = content.length();
        size_t search = from;
        while (search < n) {
            size_t pos = content.find(c, search);
            if (pos == std::string::npos) {
                return std::string::npos;
            }
            bool doubled_after = (pos + 1 < n && content[pos + 1] == c);
            bool doubled_before = (pos > search && content[pos - 1] == c);
            if (!doubled_after && !doubled_before) {
                return pos;
            }
            search = pos + 1;
        }
        return std::string::npos;
    }

    // Scan a link starting at the '[' at i. Returns true if the link text
    // and any destination are closed; i is left after what was consumed.
    bool scan_link(const std::string& content, size_t& i) {
        size_t n = content.length();
        i++;

        int depth = 1;
        bool closed = false;
        while (i < n && depth > 0) {
            if (content[i] == '\\' && i + 1 < n) {
                i += 2;
                continue;
            }
            if (content[i] == '[') {
                depth++;
            } else if (content[i] == ']') {
                depth--;
                if (depth == 0) {
                    if (i + 1 < n && (content[i + 1] == '(' || content[i + 1] == '[')) {
                        // Destination or reference: find the matching closer
                        char opener = content[i + 1];
                        char closer = (opener == '[') ? ']' : ')';
                        i += 2;
                        int inner = 1;
                        while (i < n && inner > 0) {
                            if (content[i] == '\\' && i + 1 < n) {
                                i += 2;
                                continue;
                            }
                            if (content[i] == opener) {
                                inner++;
                            } else if (content[i] == closer) {
                                inner--;
                            }
                            i++;
                        }
                        closed = (inner == 0);
                    } else {
                        // Plain text in brackets
                        closed = true;
                        i++;
                    }
                }
            }
            if (depth > 0) {
                i++;
            }
        }
        return closed;
    }
}

size_t find_safe_point(const std::string& content) {
    size_t n = content.length();
    if (n == 0) {
        return 0;
    }

    size_t safe_point = n;
    auto pull_back = [&safe_point](size_t start) {
        if (start < safe_point) {
            safe_point = start;
        }
    };

    size_t i = 0;
    while (i < n) {
        char c = content[i];

        // Escaped character
        if (c == '\\' && i + 1 < n) {
            i += 2;
            continue;
        }

        // Code span: closed by a run of the same length
        if (c == '`') {
            size_t start = i;
            while (i < n && content[i] == '`') {
                i++;
            }
            std::string run(i - start, '`');
            size_t close = content.find(run, i);
            if (close == std::string::npos) {
                pull_back(start);
            } else {
                i = close + run.length();
            }
            continue;
        }

        // ** or __
        if ((c == '*' || c == '_') && i + 1 < n && content[i + 1] == c) {
            size_t start = i;
            i += 2;
            size_t close = content.find(std::string(2, c), i);
            if (close == std::string::npos) {
                pull_back(start);
            } else {
                i = close + 2;
            }
            continue;
        }

        // * or _
        if (c == '*' || c == '_') {
            size_t start = i;
            i++;
            size_t close = find_single_marker(content, c, i);
            if (close == std::string::npos) {
                pull_back(start);
            } else {
                i = close + 1;
            }
            continue;
        }

        // ~~
        if (c == '~' && i + 1 < n && content[i + 1] == '~') {
            size_t start = i;
            i += 2;
            size_t close = content.find("~~", i);
            if (close == std::string::npos) {
                pull_back(start);
            } else {
                i = close + 2;
            }
            continue;
        }

        if (c == '[') {
            size_t start = i;
            if (!scan_link(content, i)) {
                pull_back(start);
            }
            continue;
        }

        i++;
    }

    // Trim trailing whitespace, keeping at least one character
    while (safe_point > 1 && (content[safe_point - 1] == ' ' || content[safe_point - 1] == '\t')) {
        safe_point--;
    }

    return safe_point;
}

PartialPreview::PartialPreview(OutputSink& output, int width)
    : output_(output)
    , controller_(output, width)
{
}

bool PartialPreview::update(const std::string& content, const DocumentRenderer& renderer,
                            const std::string& anchor, const std::string& separator) {
    if (content.empty()) {
        return false;
    }

    std::string safe = content.substr(0, find_safe_point(content));
    if (safe.empty() || safe == state_.safe_markdown) {
        return false;
    }

    std::string rendered = renderer.render(safe);
    while (!rendered.empty() && rendered.back() == '\n') {
        rendered.pop_back();
    }

    // The old preview no longer matches the open block, even when the new
    // prefix renders to nothing (a link reference definition, say)
    clear();
    if (rendered.empty()) {
        state_.safe_markdown = safe;
        return true;
    }

    // The trailing newline leaves the cursor below the preview, so erasing
    // always moves up at least one row
    output_.write(separator + rendered + "\n");

    state_.safe_markdown = safe;
    state_.safe_rendered = rendered;
    state_.anchor = anchor;
    state_.line_count = controller_.count_lines(anchor + separator + rendered + "\n");

    verbose_log("stream", "preview " + std::to_string(safe.size()) + " bytes over " +
                std::to_string(state_.line_count) + " rows");
    return true;
}

void PartialPreview::clear() {
    if (state_.line_count > 0) {
        // Erasing starts at the anchor row, so the anchor is written again
        controller_.clear_lines(state_.line_count);
        output_.write(state_.anchor);
    }
    state_ = PreviewState{};
}

void PartialPreview::discard() {
    state_ = PreviewState{};
}

} // namespace mdstream
