// SPDX-License-Identifier: Apache-2.0
#include <parser/Ansi.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tfview;

TEST_CASE("Ansi: strip removes every CSI sequence", "[parser][ansi]")
{
    CHECK(ansi::strip("\033[1m\033[31mError:\033[0m boom") == "Error: boom");
    CHECK(ansi::strip("\033[38;2;255;0;0mred\033[m") == "red");
    CHECK(ansi::strip("\033[2K\033[1Gprogress") == "progress");
    CHECK(ansi::strip("plain text") == "plain text");
}

TEST_CASE("Ansi: strip keeps box drawing markers visible", "[parser][ansi]")
{
    CHECK(ansi::strip("\033[31m╷\033[0m") == "╷");
    CHECK(ansi::strip("\033[31m│\033[0m \033[1mError: \033[0mboom") == "│ Error: boom");
}

TEST_CASE("Ansi: strip survives truncated sequences", "[parser][ansi]")
{
    CHECK(ansi::strip("text\033[31") == "text");
    CHECK(ansi::strip("text\033") == "text\033");
    CHECK(ansi::strip("\033[") == "");
}

TEST_CASE("Ansi: sanitize keeps bold and underline only", "[parser][ansi]")
{
    SECTION("color and reset are removed")
    {
        CHECK(ansi::sanitize("\033[31mred\033[0m") == "red");
        CHECK(ansi::sanitize("\033[mplain") == "plain");
    }

    SECTION("bold and underline survive")
    {
        CHECK(ansi::sanitize("\033[1mbold\033[0m") == "\033[1mbold");
        CHECK(ansi::sanitize("\033[4mline\033[0m") == "\033[4mline");
    }

    SECTION("mixed parameters are filtered")
    {
        CHECK(ansi::sanitize("\033[1;31mx") == "\033[1mx");
        CHECK(ansi::sanitize("\033[0;1;4mx") == "\033[1;4mx");
        CHECK(ansi::sanitize("\033[38;5;1;4mx") == "\033[4mx");
        CHECK(ansi::sanitize("\033[38;2;1;4;1;1mx") == "\033[1mx");
    }

    SECTION("non-SGR sequences are removed")
    {
        CHECK(ansi::sanitize("\033[2Kline") == "line");
        CHECK(ansi::sanitize("\033[?25lline") == "line");
    }
}

TEST_CASE("Ansi: sanitize never emits a reset-all code", "[parser][ansi]")
{
    auto const out = ansi::sanitize("\033[0m\033[1m\033[0m\033[m\033[22;0mtext\033[0m");
    CHECK(out.find("\033[0m") == std::string::npos);
    CHECK(out.find("\033[m") == std::string::npos);
    CHECK(ansi::strip(out) == "text");
}

TEST_CASE("Ansi: csiLength measures sequences", "[parser][ansi]")
{
    CHECK(ansi::csiLength("\033[31mx", 0) == 5);
    CHECK(ansi::csiLength("x\033[1m", 1) == 4);
    CHECK(ansi::csiLength("x\033[1m", 0) == 0);
    CHECK(ansi::csiLength("\033x", 0) == 0);
}
