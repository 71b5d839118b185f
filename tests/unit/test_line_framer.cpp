#include <gtest/gtest.h>
#include "mcpguard/line_framer.hpp"

#include <string>
#include <vector>

using namespace mcpguard;

namespace {

std::vector<std::string> frame_in_chunks(const std::string& input, size_t chunk) {
    LineFramer framer;
    std::vector<std::string> out;
    for (size_t pos = 0; pos < input.size(); pos += chunk) {
        framer.append(input.substr(pos, chunk));
        for (auto& line : framer.extract_lines()) out.push_back(std::move(line));
    }
    return out;
}

} // anonymous namespace

TEST(LineFramer, SingleCompleteLine) {
    LineFramer f;
    f.append(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_FALSE(f.has_partial_data());
}

TEST(LineFramer, KeepsPartialTail) {
    LineFramer f;
    f.append("first\nsec");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_TRUE(f.has_partial_data());
    EXPECT_EQ(f.buffered_size(), 3u);

    f.append("ond\n");
    lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "second");
    EXPECT_FALSE(f.has_partial_data());
}

TEST(LineFramer, NoDelimiterYieldsNothing) {
    LineFramer f;
    std::string big(100000, 'x');
    f.append(big);
    EXPECT_TRUE(f.extract_lines().empty());
    EXPECT_EQ(f.buffered_size(), big.size());
}

TEST(LineFramer, TrimsCarriageReturn) {
    LineFramer f;
    f.append("a\r\nb\r\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
}

TEST(LineFramer, SkipsEmptyLines) {
    LineFramer f;
    f.append("\n\r\none\n\n\ntwo\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(LineFramer, DropsInvalidUtf8Frame) {
    LineFramer f;
    std::string bad = "bad \xC3\x28 frame";
    f.append("good\n" + bad + "\nalso good\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "good");
    EXPECT_EQ(lines[1], "also good");
    EXPECT_EQ(f.dropped_frames(), 1u);
}

TEST(LineFramer, KeepsMultibyteUtf8) {
    LineFramer f;
    f.append("{\"text\":\"h\xC3\xA9llo \xE2\x9C\x93\"}\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(f.dropped_frames(), 0u);
}

TEST(LineFramer, ChunkBoundariesDoNotChangeOutput) {
    const std::string input =
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\r\n"
        "\n"
        "not json at all\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\"}}\n"
        "trailing-without-newline";

    const auto whole = frame_in_chunks(input, input.size());
    ASSERT_EQ(whole.size(), 4u);
    for (size_t chunk : {1u, 2u, 3u, 7u, 16u, 64u}) {
        EXPECT_EQ(frame_in_chunks(input, chunk), whole) << "chunk size " << chunk;
    }
}

TEST(LineFramer, CrlfSplitAcrossChunks) {
    LineFramer f;
    f.append("abc\r");
    EXPECT_TRUE(f.extract_lines().empty());
    f.append("\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "abc");
}

TEST(LineFramer, Clear) {
    LineFramer f;
    f.append("partial");
    f.clear();
    EXPECT_FALSE(f.has_partial_data());
    f.append("x\n");
    auto lines = f.extract_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "x");
}
