#include <gtest/gtest.h>

#include <sstream> // for std::istringstream, std::ostringstream

#include "relay/line_source.hpp"

#include "scratch_directory.hpp"

using namespace relay;

TEST(stream_line_source, read_line)
{
    std::istringstream input{"show\r\n\nremove 3"};
    auto source = stream_line_source{input, "stdin"};
    EXPECT_EQ(source.name(), "stdin");
    EXPECT_EQ(source.line_number(), 0u);
    EXPECT_EQ(source.read_line(), std::optional<std::string>("show"));
    EXPECT_EQ(source.read_line(), std::optional<std::string>(""));
    EXPECT_EQ(source.read_line(), std::optional<std::string>("remove 3"));
    EXPECT_EQ(source.line_number(), 3u);
    EXPECT_FALSE(source.read_line());
    EXPECT_EQ(source.line_number(), 3u);
}

TEST(stream_line_source, prompt)
{
    std::istringstream input{"a\nb\n"};
    std::ostringstream output;
    auto source = stream_line_source{input, "stdin", &output, "> "};
    EXPECT_TRUE(source.read_line());
    EXPECT_TRUE(source.read_line());
    EXPECT_EQ(output.str(), "> > ");
}

TEST(file_line_source, read_line)
{
    const auto dir = scratch_directory{};
    const auto path = dir.write("script", "info\nshow\n");
    auto source = file_line_source{path};
    EXPECT_TRUE(source.is_open());
    EXPECT_EQ(source.name(), path.string());
    EXPECT_EQ(source.read_line(), std::optional<std::string>("info"));
    EXPECT_EQ(source.read_line(), std::optional<std::string>("show"));
    EXPECT_FALSE(source.read_line());
    EXPECT_EQ(source.line_number(), 2u);
}

TEST(file_line_source, missing_file)
{
    const auto dir = scratch_directory{};
    auto source = file_line_source{dir.path / "missing"};
    EXPECT_FALSE(source.is_open());
    EXPECT_FALSE(source.read_line());
}
