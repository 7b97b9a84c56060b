#pragma once

/**
 * Exception types raised by the streaming renderer.
 */

#include <stdexcept>
#include <string>

namespace mdstream {

/**
 * The document renderer could not be built or could not render a document.
 *
 * Thrown from renderer construction (unknown style, invalid width) and from
 * any commit, preview, flush or resize that needs a render.
 */
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A re-render changed bytes that were already written to a sink that cannot
 * be reset. There is no way to take those bytes back.
 */
class NonResettableWriterError : public std::runtime_error {
public:
    NonResettableWriterError()
        : std::runtime_error("streaming renderer cannot update changed prefix with non-resettable writer") {}
};

} // namespace mdstream
