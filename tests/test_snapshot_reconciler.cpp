#include <catch2/catch.hpp>
#include "errors.hpp"
#include "output_sink.hpp"
#include "snapshot_reconciler.hpp"

using namespace mdstream;

TEST_CASE("Growing snapshots append only the delta", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("Hello", false);
    reconciler.apply("Hello world", false);

    REQUIRE(sink.str() == "Hello world");
    REQUIRE(sink.write_count() == 2);
    REQUIRE(reconciler.last_rendered() == "Hello world");
    REQUIRE(reconciler.rendered_len() == 11);
    REQUIRE_FALSE(reconciler.stale());
}

TEST_CASE("Identical snapshot writes nothing", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("same", false);
    reconciler.apply("same", false);
    reconciler.apply("same", true);

    REQUIRE(sink.str() == "same");
    REQUIRE(sink.write_count() == 1);
}

TEST_CASE("Changed prefix with rewrite allowed resets the sink", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("[x]", false);
    reconciler.apply("x <http://e.com>", true);

    REQUIRE(sink.str() == "x <http://e.com>");
    REQUIRE_FALSE(reconciler.stale());
}

TEST_CASE("Shorter snapshot always rewrites", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("long text", false);
    reconciler.apply("short", false);

    REQUIRE(sink.str() == "short");
    REQUIRE(reconciler.rendered_len() == 5);
}

TEST_CASE("Longer snapshot with changed prefix appends the tail until the next rewrite", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("prefix-value", false);
    reconciler.apply("prefix-updated-value", false);

    REQUIRE(sink.str() == "prefix-valueed-value");
    REQUIRE(reconciler.stale());
    REQUIRE(reconciler.last_rendered() == "prefix-updated-value");

    SECTION("Same snapshot with rewrite repairs the sink") {
        reconciler.apply("prefix-updated-value", true);
        REQUIRE(sink.str() == "prefix-updated-value");
        REQUIRE_FALSE(reconciler.stale());
    }

    SECTION("Appending without rewrite keeps it stale") {
        reconciler.apply("prefix-updated-value!", false);
        REQUIRE(sink.str() == "prefix-valueed-value!");
        REQUIRE(reconciler.stale());
    }
}

TEST_CASE("Tail append never starts inside an escape sequence", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("xx", false);
    reconciler.apply("\033[1mhello", false);

    REQUIRE(sink.str() == "xxhello");
}

TEST_CASE("Non-resettable sink rejects a changed prefix", "[reconciler]") {
    std::string received;
    CallbackSink sink([&received](const std::string& data) { received += data; });
    SnapshotReconciler reconciler(sink);

    reconciler.apply("Hello", false);
    reconciler.apply("Hello world", false);
    REQUIRE(received == "Hello world");

    REQUIRE_THROWS_AS(reconciler.apply("Goodbye", true), NonResettableWriterError);
    REQUIRE(received == "Hello world");

    try {
        reconciler.apply("Goodbye", true);
    } catch (const NonResettableWriterError& e) {
        REQUIRE(std::string(e.what()).find("non-resettable writer") != std::string::npos);
    }
}

TEST_CASE("Reset forgets the emitted state", "[reconciler]") {
    BufferSink sink;
    SnapshotReconciler reconciler(sink);

    reconciler.apply("abc", false);
    reconciler.reset();
    REQUIRE(reconciler.last_rendered().empty());
    REQUIRE(reconciler.rendered_len() == 0);

    reconciler.apply("abc", false);
    REQUIRE(sink.str() == "abcabc");
}
