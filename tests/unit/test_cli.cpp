#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include <string>
#include <vector>

using namespace cg;

class CLITest : public ::testing::Test {
protected:
    CLI cli{"cg", "test"};
    Args captured;
    int calls = 0;

    void SetUp() override {
        cli.register_command({
            "query",
            "Query the graph",
            {
                {"query", "Q", "Query text", "", true, false},
                {"top-k", "k", "Results per category", "", false, false},
                {"hops", "n", "Maximum hops", "2", false, false},
                {"json", "j", "Print JSON", "", false, true}
            },
            [this](const Args& args) {
                captured = args;
                ++calls;
                return 0;
            }
        });
    }

    int run(std::vector<std::string> tokens) {
        tokens.insert(tokens.begin(), "cg");
        std::vector<char*> argv;
        for (auto& token : tokens) argv.push_back(&token[0]);
        return cli.run(static_cast<int>(argv.size()), argv.data());
    }
};

// ==========================================
// Option Parsing Tests
// ==========================================

TEST_F(CLITest, LongShortAndInlineForms) {
    EXPECT_EQ(run({"query", "-Q", "audit log", "--top-k=5", "-j"}), 0);
    ASSERT_EQ(calls, 1);
    EXPECT_EQ(captured.require("query"), "audit log");
    EXPECT_EQ(captured.get("top-k").as_int(20), 5);
    EXPECT_TRUE(captured.has("json"));
}

TEST_F(CLITest, DefaultsApplied) {
    EXPECT_EQ(run({"query", "--query", "x"}), 0);
    EXPECT_EQ(captured.get("hops").as_int(), 2);
    EXPECT_EQ(captured.get("top-k").as_int(20), 20);
    EXPECT_FALSE(captured.has("json"));
    EXPECT_EQ(captured.get("mode", "keyword").value, "keyword");
}

TEST_F(CLITest, RejectsBadInvocations) {
    EXPECT_EQ(run({"query"}), 1);                              // missing --query
    EXPECT_EQ(run({"query", "--query", "x", "--fuzzy"}), 1);   // unknown option
    EXPECT_EQ(run({"query", "--query"}), 1);                   // missing value
    EXPECT_EQ(run({"query", "--query", "x", "--json=yes"}), 1);
    EXPECT_EQ(run({"bogus"}), 1);
    EXPECT_EQ(calls, 0);
}

TEST_F(CLITest, HelpAndVersionSkipHandler) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_EQ(run({"help", "query"}), 0);
    EXPECT_EQ(run({"query", "--help"}), 0);
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(calls, 0);
}

TEST_F(CLITest, HandlerExceptionBecomesExitCode) {
    cli.register_command({"fail", "Always fails", {}, [](const Args&) -> int {
        throw std::runtime_error("boom");
    }});
    EXPECT_EQ(run({"fail"}), 1);
}

// ==========================================
// Value Conversion Tests
// ==========================================

TEST(ArgValueTest, StrictIntegers) {
    EXPECT_EQ((ArgValue{"42", true}).as_int(), 42);
    EXPECT_EQ((ArgValue{"-3", true}).as_int(), -3);
    EXPECT_EQ((ArgValue{"", false}).as_int(7), 7);
    EXPECT_THROW((ArgValue{"5x", true}).as_int(), std::invalid_argument);
    EXPECT_THROW((ArgValue{"abc", true}).as_int(), std::invalid_argument);
    EXPECT_THROW((ArgValue{"99999999999999999999", true}).as_int(), std::invalid_argument);
}

TEST(ArgValueTest, ListTrimsAndDropsEmpty) {
    auto list = (ArgValue{" dec_001, ,ri_audit_log ", true}).as_list();
    ASSERT_EQ(list.size(), 2);
    EXPECT_EQ(list[0], "dec_001");
    EXPECT_EQ(list[1], "ri_audit_log");
    EXPECT_TRUE((ArgValue{}).as_list().empty());
}

TEST(ArgsTest, RequireThrowsWhenUnset) {
    Args args;
    EXPECT_THROW(args.require("query"), std::invalid_argument);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
