#pragma once

/**
 * Output destinations for rendered markdown.
 *
 * Every sink accepts bytes. Sinks that can also discard what they have
 * received so far (reset) allow the renderer to rewrite its output when a
 * re-render changes bytes that were already emitted.
 */

#include <string>
#include <functional>

namespace mdstream {

/**
 * Byte sink with an optional reset capability.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Writes bytes to the sink.
    virtual void write(const std::string& data) = 0;

    // Returns true if reset() is supported.
    virtual bool supports_reset() const { return false; }

    // Discards everything written so far. Throws std::logic_error unless
    // supports_reset() is true.
    virtual void reset();

    // Moves the cursor up n rows to column 1 and erases to the end of the
    // screen. The default writes the escape sequence like any other bytes.
    virtual void erase_rows(int n);
};

/**
 * In-memory resettable sink. Used by tests and by callers that own the
 * screen themselves and only need the current rendered text.
 */
class BufferSink : public OutputSink {
public:
    void write(const std::string& data) override;
    bool supports_reset() const override { return true; }
    void reset() override;

    const std::string& str() const { return buffer_; }

    // Number of write() calls that carried at least one byte.
    size_t write_count() const { return write_count_; }

private:
    std::string buffer_;
    size_t write_count_ = 0;
};

/**
 * Append-only sink forwarding every write to a callback.
 */
class CallbackSink : public OutputSink {
public:
    using OutputCallback = std::function<void(const std::string&)>;

    explicit CallbackSink(OutputCallback output);

    void write(const std::string& data) override;

private:
    OutputCallback output_;
};

/**
 * Sink writing to stdout.
 *
 * Reset is implemented with cursor control: the cursor moves back up over
 * every row this sink has written and the screen is erased from there. Rows
 * that already scrolled off the top of the screen cannot be reached, so
 * content taller than the terminal is only partially retracted.
 */
class TerminalSink : public OutputSink {
public:
    /**
     * @param terminal_width Width used to count wrapped rows.
     *        0 = auto-detect.
     */
    explicit TerminalSink(int terminal_width = 0);

    void write(const std::string& data) override;
    bool supports_reset() const override { return true; }
    void reset() override;
    void erase_rows(int n) override;

    void set_width(int terminal_width);

private:
    int terminal_width_;
    std::string visible_;  // Text on screen since the last reset.

    int width() const;
};

} // namespace mdstream
