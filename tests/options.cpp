#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "relay/options.hpp"

using namespace relay;

namespace {

auto parse(std::vector<std::string> args, std::ostream& diags)
    -> std::optional<shell_options>
{
    args.insert(args.begin(), "relay");
    return parse_options(args, diags);
}

}

TEST(parse_options, defaults)
{
    std::ostringstream diags;
    const auto opts = parse({}, diags);
    ASSERT_TRUE(opts);
    EXPECT_EQ(opts->peer.host, "localhost");
    EXPECT_EQ(opts->peer.port, "4040");
    EXPECT_EQ(opts->peer.timeout.count(), 0);
    EXPECT_FALSE(opts->script);
    EXPECT_EQ(opts->editor, emacs_editor_str);
    EXPECT_EQ(opts->history_size, 100);
    EXPECT_FALSE(opts->stop_script_on_error);
    EXPECT_FALSE(opts->help);
    EXPECT_FALSE(opts->usage);
    EXPECT_EQ(diags.str(), "");
}

TEST(parse_options, no_arguments_at_all)
{
    std::ostringstream diags;
    EXPECT_TRUE(parse_options(std::vector<std::string>{}, diags));
}

TEST(parse_options, every_option)
{
    std::ostringstream diags;
    const auto opts = parse({
        "--host=example.org", "--port=5050", "--timeout=250",
        "--file=setup.txt", "--editor=vi", "--history=20",
        "--stop-on-error", "--help", "--usage",
    }, diags);
    ASSERT_TRUE(opts);
    EXPECT_EQ(opts->peer.host, "example.org");
    EXPECT_EQ(opts->peer.port, "5050");
    EXPECT_EQ(opts->peer.timeout, std::chrono::milliseconds{250});
    ASSERT_TRUE(opts->script);
    EXPECT_EQ(*opts->script, std::filesystem::path{"setup.txt"});
    EXPECT_EQ(opts->editor, vi_editor_str);
    EXPECT_EQ(opts->history_size, 20);
    EXPECT_TRUE(opts->stop_script_on_error);
    EXPECT_TRUE(opts->help);
    EXPECT_TRUE(opts->usage);
}

TEST(parse_options, invalid_values)
{
    for (const auto arg: {
        "--host=", "--port=0", "--port=65536", "--port=http",
        "--timeout=-1", "--file=", "--editor=nano", "--history=0",
    }) {
        std::ostringstream diags;
        EXPECT_FALSE(parse({arg}, diags)) << arg;
        EXPECT_NE(diags.str().find("invalid argument"), std::string::npos)
            << arg;
    }
}

TEST(parse_options, unrecognized_argument)
{
    std::ostringstream diags;
    EXPECT_FALSE(parse({"--verbose"}, diags));
    EXPECT_EQ(diags.str(), "\"--verbose\": unrecognized argument\n");
}

TEST(write_usage, mentions_options)
{
    std::ostringstream os;
    write_usage(os, "relay");
    EXPECT_EQ(os.str().find("usage: relay"), 0u);
    for (const auto name: {"--host=", "--port=", "--file=", "--stop-on-error"}) {
        EXPECT_NE(os.str().find(name), std::string::npos) << name;
    }
}

TEST(write_help, starts_with_usage)
{
    std::ostringstream usage;
    write_usage(usage, "relay");
    std::ostringstream help;
    write_help(help, "relay");
    EXPECT_EQ(help.str().find(usage.str()), 0u);
    EXPECT_GT(help.str().size(), usage.str().size());
    EXPECT_NE(help.str().find("failure status"), std::string::npos);
}
