#include <gtest/gtest.h>
#include <guard/process_snapshot.hpp>
#include <platform/platform.hpp>
#include <algorithm>

TEST(ProcessSnapshot, ParsesPsOutput) {
    auto entries = parse_process_list(
        "  PID COMMAND\n"
        "    1 /sbin/init splash\n"
        "  412 /usr/sbin/cron -f\n"
        "12345 lifeline nightly:lifeline\n");

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].pid, 1);
    EXPECT_EQ(entries[0].command, "/sbin/init splash");
    EXPECT_EQ(entries[1].pid, 412);
    EXPECT_EQ(entries[1].command, "/usr/sbin/cron -f");
    EXPECT_EQ(entries[2].pid, 12345);
    EXPECT_EQ(entries[2].command, "lifeline nightly:lifeline");
}

TEST(ProcessSnapshot, DropsHeaderAndGarbage) {
    auto entries = parse_process_list(
        "  PID COMMAND\n"
        "\n"
        "not a process line\n"
        "abc123 sh\n"
        "42\n"
        "   7 bash\n");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].pid, 7);
    EXPECT_EQ(entries[0].command, "bash");
}

TEST(ProcessSnapshot, TrimsCommandWhitespace) {
    auto entries = parse_process_list("  9   sleep 60   \r\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].command, "sleep 60");
}

TEST(ProcessSnapshot, KeepsInnerWhitespaceAndArguments) {
    auto entries = parse_process_list("10 job  --flag\tvalue\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].command, "job  --flag\tvalue");
}

TEST(ProcessSnapshot, RequiresWhitespaceAfterPid) {
    EXPECT_TRUE(parse_process_list("10job\n").empty());
}

TEST(ProcessSnapshot, DropsBlankCommands) {
    EXPECT_TRUE(parse_process_list("10    \n").empty());
}

TEST(ProcessSnapshot, DropsOverflowingPid) {
    EXPECT_TRUE(parse_process_list("99999999999999999999 huge\n").empty());
}

TEST(ProcessSnapshot, PreservesListingOrder) {
    auto entries = parse_process_list("30 c\n10 a\n20 b\n");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].pid, 30);
    EXPECT_EQ(entries[1].pid, 10);
    EXPECT_EQ(entries[2].pid, 20);
}

TEST(ProcessSnapshot, EmptyOutputIsEmptyList) {
    EXPECT_TRUE(parse_process_list("").empty());
}

TEST(ProcessSnapshot, UnavailableCommandIsAbsent) {
    PsProcessLister lister("/nonexistent/lifeline-test-ps");
    EXPECT_FALSE(lister.list().has_value());
}

TEST(ProcessSnapshot, LiveListingContainsSelf) {
    PsProcessLister lister;
    auto snapshot = lister.list();
    if (!snapshot) GTEST_SKIP() << "ps is not available";

    ASSERT_FALSE(snapshot->empty());
    int self = platform::current_pid();
    auto it = std::find_if(snapshot->begin(), snapshot->end(),
                           [&](const ProcessEntry& p) { return p.pid == self; });
    ASSERT_NE(it, snapshot->end());
    EXPECT_FALSE(it->command.empty());
    for (const auto& p : *snapshot) {
        EXPECT_GT(p.pid, 0);
        EXPECT_FALSE(p.command.empty());
    }
}

TEST(ProcessSnapshot, VeryLongCommandLine) {
    std::string classpath(150000, 'x');
    auto entries = parse_process_list(
        "  PID COMMAND\n"
        " 4242 java -cp " + classpath + " Main\n"
        " 4243 lifeline nightly:lifeline\n");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].pid, 4242);
    EXPECT_EQ(entries[0].command.size(), classpath.size() + 14);
    EXPECT_EQ(entries[1].command, "lifeline nightly:lifeline");
}

TEST(ProcessSnapshot, TrimsVerticalTabAndFormFeed) {
    auto entries = parse_process_list("12 \v\fjob --x\f\v\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].command, "job --x");
}

TEST(ProcessSnapshot, TabSeparatesPidFromCommand) {
    auto entries = parse_process_list("\t12\tjob\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].pid, 12);
    EXPECT_EQ(entries[0].command, "job");
}
