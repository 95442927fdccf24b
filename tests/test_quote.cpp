/*
 * Quoting tests - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shellwrap/shell/quote.hpp>

using namespace shellwrap;

TEST(QuotePosix, PriorityRule) {
    EXPECT_EQ(quote_for_shell({"a b", "c\"d"}, ShellFamily::Posix), "\"a b\" 'c\"d'");
    EXPECT_EQ(quote_for_shell({"it's"}, ShellFamily::Posix), "\"it's\"");
    EXPECT_EQ(quote_for_shell({"ls", "-l"}, ShellFamily::Posix), "ls -l");
    EXPECT_EQ(quote_for_shell({"python", "-c", "a\nb"}, ShellFamily::Posix), "python -c \"a\nb\"");
    EXPECT_EQ(quote_for_shell({}, ShellFamily::Posix), "");
}

TEST(QuotePosix, KeepsArgumentCount) {
    std::vector<std::string> argv = {"echo", "hello world", "x", "a'b c"};
    std::string out = quote_for_shell(argv, ShellFamily::Posix);
    EXPECT_EQ(out, "echo \"hello world\" x \"a'b c\"");
}

// Known limitation: the chosen quote is not escaped when the argument holds both kinds.
TEST(QuotePosix, MixedQuotesNotEscaped) {
    EXPECT_EQ(quote_for_shell({"a'b\"c"}, ShellFamily::Posix), "'a'b\"c'");
}

TEST(QuoteCmd, List2cmdline) {
    EXPECT_EQ(quote_for_shell({"a b", "c"}, ShellFamily::Cmd), "\"a b\" c");
    EXPECT_EQ(quote_for_shell({""}, ShellFamily::Cmd), "\"\"");
    EXPECT_EQ(quote_for_shell({"a\"b"}, ShellFamily::Cmd), "a\\\"b");
    EXPECT_EQ(quote_for_shell({"a\\\"b"}, ShellFamily::Cmd), "a\\\\\\\"b");
    EXPECT_EQ(quote_for_shell({"C:\\dir\\"}, ShellFamily::Cmd), "C:\\dir\\");
    EXPECT_EQ(quote_for_shell({"C:\\my dir\\"}, ShellFamily::Cmd), "\"C:\\my dir\\\\\"");
    EXPECT_EQ(quote_for_shell({"tab\there"}, ShellFamily::Cmd), "\"tab\there\"");
}

TEST(QuoteByName, CmdExeOnly) {
    EXPECT_EQ(family_for_shell("cmd.exe"), ShellFamily::Cmd);
    EXPECT_EQ(family_for_shell("bash"), ShellFamily::Posix);
    EXPECT_EQ(quote_for_shell({"a b"}, std::string("cmd.exe")), "\"a b\"");
    EXPECT_EQ(family_for(true), ShellFamily::Cmd);
    EXPECT_EQ(family_for(false), ShellFamily::Posix);
}

TEST(QuoteByName, EmptyNameUsesHostFamily) {
#ifdef _WIN32
    EXPECT_EQ(family_for_shell(""), ShellFamily::Cmd);
    EXPECT_EQ(quote_for_shell({"a b", "c"}, std::string()), "\"a b\" c");
#else
    EXPECT_EQ(family_for_shell(""), ShellFamily::Posix);
    EXPECT_EQ(quote_for_shell({"it's", "c"}, std::string()), "\"it's\" c");
#endif
}
