#include <string>
#include <string_view>
#include <vector>

#include <doctest/doctest.h>

#include "teakit/detail/input_decoder.hpp"

using teakit::key_msg;
using teakit::key_type;
using teakit::msg;

namespace {
struct collector {
    teakit::basic_input_decoder decoder;
    std::vector<msg> out;

    std::vector<msg>& feed(std::string_view chunk, bool more_data = false)
    {
        decoder.feed(chunk, more_data, [this](msg m) { out.push_back(std::move(m)); });
        return out;
    }

    std::vector<msg>& flush()
    {
        decoder.flush([this](msg m) { out.push_back(std::move(m)); });
        return out;
    }
};

std::vector<std::string> key_names(std::vector<msg> const& msgs)
{
    std::vector<std::string> names;
    for (auto& m : msgs) {
        if (auto key = m.get_if<key_msg>()) {
            names.push_back(key->to_string());
        } else {
            names.push_back("<other>");
        }
    }
    return names;
}
}  // namespace

TEST_SUITE_BEGIN("Input Decoder");

TEST_CASE("Groups Printable Runes")
{
    collector c;
    auto& out = c.feed("abc");

    REQUIRE(out.size() == 1);
    auto& key = out[0].as<key_msg>();
    CHECK(key.type == key_type::runes);
    CHECK(key.runes == U"abc");
    CHECK_FALSE(key.alt);

    CHECK(key_names(c.feed("hi there")) == std::vector<std::string>{"abc", "hi", " ", "there"});
    CHECK(out[2].as<key_msg>().type == key_type::space);
}

TEST_CASE("Control Keys")
{
    collector c;
    auto& out = c.feed(std::string_view{"\x03\r\t\x7f\x01", 5});

    CHECK(key_names(out) == std::vector<std::string>{"ctrl+c", "enter", "tab", "backspace", "ctrl+a"});
    CHECK(out[0].as<key_msg>().type == key_type::ctrl_c);
    CHECK(out[1].as<key_msg>().type == key_type::enter);

    c.out.clear();
    c.feed(std::string_view{"\0", 1});
    CHECK(key_names(c.out) == std::vector<std::string>{"ctrl+@"});
}

TEST_CASE("Cursor And Editing Keys")
{
    collector c;
    auto& out = c.feed("\x1b[A\x1b[B\x1bOC\x1b[D\x1b[3~\x1b[5~\x1b[Z\x1bOP");

    CHECK(key_names(out)
          == std::vector<std::string>{"up", "down", "right", "left", "delete", "pgup", "shift+tab", "f1"});
}

TEST_CASE("Alt Modified Keys")
{
    collector c;
    auto& out = c.feed("\x1b[1;3A");
    REQUIRE(out.size() == 1);
    CHECK(out[0].as<key_msg>().type == key_type::up);
    CHECK(out[0].as<key_msg>().alt);

    c.out.clear();
    CHECK(key_names(c.feed("\x1b" "a")) == std::vector<std::string>{"alt+a"});

    // alt takes a single rune only
    c.out.clear();
    CHECK(key_names(c.feed("\x1b" "ab")) == std::vector<std::string>{"alt+a", "b"});

    c.out.clear();
    CHECK(key_names(c.feed("\x1b\r")) == std::vector<std::string>{"alt+enter"});

    c.out.clear();
    CHECK(key_names(c.feed("\x1b\x1b[A")) == std::vector<std::string>{"alt+up"});
}

TEST_CASE("Lone Escape")
{
    collector c;
    CHECK(key_names(c.feed("\x1b")) == std::vector<std::string>{"esc"});
    CHECK(c.decoder.num_pending() == 0);

    // held back while the caller knows more bytes follow
    c.out.clear();
    CHECK(c.feed("\x1b", true).empty());
    CHECK(c.decoder.num_pending() == 1);
    CHECK(key_names(c.flush()) == std::vector<std::string>{"esc"});
}

TEST_CASE("Bracketed Paste")
{
    collector c;
    auto& out = c.feed("\x1b[200~hello\r\nworld\x1b[201~x");

    REQUIRE(out.size() == 2);
    REQUIRE(out[0].is<teakit::paste_msg>());
    CHECK(out[0].as<teakit::paste_msg>().content == "hello\r\nworld");
    CHECK(key_names({out[1]}) == std::vector<std::string>{"x"});
}

TEST_CASE("Paste Split Across Chunks")
{
    collector c;
    CHECK(c.feed("\x1b[200~hel").empty());
    CHECK(c.feed("lo\x1b[20").empty());

    auto& out = c.feed("1~");
    REQUIRE(out.size() == 1);
    CHECK(out[0].as<teakit::paste_msg>().content == "hello");
    CHECK(c.decoder.num_pending() == 0);
}

TEST_CASE("Focus Reports")
{
    collector c;
    auto& out = c.feed("\x1b[I\x1b[O");

    REQUIRE(out.size() == 2);
    CHECK(out[0].is<teakit::focus_msg>());
    CHECK(out[1].is<teakit::blur_msg>());
}

TEST_CASE("Unknown Sequences")
{
    collector c;
    auto& out = c.feed("\x1b[99;99xq");

    REQUIRE(out.size() == 2);
    REQUIRE(out[0].is<teakit::unknown_sequence_msg>());
    CHECK(out[0].as<teakit::unknown_sequence_msg>().sequence == "\x1b[99;99x");
    CHECK(key_names({out[1]}) == std::vector<std::string>{"q"});

    // stray continuation byte
    c.out.clear();
    c.feed("\x80");
    REQUIRE(c.out.size() == 1);
    CHECK(c.out[0].as<teakit::unknown_sequence_msg>().sequence == "\x80");
}

TEST_CASE("Sequence Split Across Chunks")
{
    collector c;
    CHECK(c.feed("\x1b[").empty());
    CHECK(c.feed("1;").empty());
    CHECK(key_names(c.feed("3B")) == std::vector<std::string>{"alt+down"});
}

TEST_CASE("Incomplete Sequence Is Flushed")
{
    collector c;
    CHECK(c.feed("\x1b[12").empty());

    auto& out = c.flush();
    REQUIRE(out.size() == 1);
    CHECK(out[0].as<teakit::unknown_sequence_msg>().sequence == "\x1b[12");
    CHECK(c.decoder.num_pending() == 0);
}

TEST_CASE("Multibyte Rune Split Across Chunks")
{
    // U+AC00, encoded as EA B0 80
    collector c;
    CHECK(c.feed("\xea\xb0").empty());
    CHECK(c.decoder.num_pending() == 2);

    auto& out = c.feed("\x80");
    REQUIRE(out.size() == 1);
    CHECK(out[0].as<key_msg>().runes == U"가");
    CHECK(out[0].as<key_msg>().to_string() == "\xea\xb0\x80");
}

TEST_CASE("Key Names")
{
    key_msg key;
    key.type = key_type::page_down;
    CHECK(key.to_string() == "pgdown");

    key.type = key_type::ctrl_z;
    key.alt = true;
    CHECK(key.to_string() == "alt+ctrl+z");

    key.type = key_type::escape;
    key.alt = false;
    CHECK(key.to_string() == "esc");
}

TEST_SUITE_END();
