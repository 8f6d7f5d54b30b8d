// MIT License
//
// Copyright (c) 2021-2022. Seungwoo Kang
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
// project home: https://github.com/perfkitpp

#include "teakit/detail/input_decoder.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {
using namespace teakit;

constexpr char ESC = '\x1b';
constexpr std::string_view PASTE_BEGIN = "\x1b[200~";
constexpr std::string_view PASTE_END = "\x1b[201~";
constexpr std::string_view FOCUS_IN = "\x1b[I";
constexpr std::string_view FOCUS_OUT = "\x1b[O";

// incomplete escape sequences longer than this are given up
constexpr size_t MAX_PENDING_SEQUENCE = 32;

struct detect_result {
    size_t width = 0;  // zero if more bytes are required
    msg message;
};

bool starts_with(std::string_view str, std::string_view prefix)
{
    return str.substr(0, prefix.size()) == prefix;
}

key_msg make_key(key_type type, bool alt = false)
{
    key_msg key;
    key.type = type;
    key.alt = alt;
    return key;
}

key_type control_key(int ch)
{
    switch (ch) {
        case 0x00: return key_type::ctrl_at;
        case 0x09: return key_type::tab;
        case 0x0d: return key_type::enter;
        case 0x1c: return key_type::ctrl_backslash;
        case 0x1d: return key_type::ctrl_close_bracket;
        case 0x1e: return key_type::ctrl_caret;
        case 0x1f: return key_type::ctrl_underscore;
        case 0x7f: return key_type::backspace;
        default: return key_type(int(key_type::ctrl_a) + ch - 1);
    }
}

struct sequence_table {
    std::unordered_map<std::string, key_msg> keys;
    std::vector<size_t> lengths;  // descending, for longest match
};

sequence_table const& sequences()
{
    static sequence_table const table = [] {
        sequence_table t;

        std::pair<std::string_view, key_type> const plain[] = {
                {"\x1b[A", key_type::up},
                {"\x1b[B", key_type::down},
                {"\x1b[C", key_type::right},
                {"\x1b[D", key_type::left},
                {"\x1bOA", key_type::up},
                {"\x1bOB", key_type::down},
                {"\x1bOC", key_type::right},
                {"\x1bOD", key_type::left},
                {"\x1b[Z", key_type::shift_tab},
                {"\x1b[H", key_type::home},
                {"\x1b[F", key_type::end},
                {"\x1bOH", key_type::home},
                {"\x1bOF", key_type::end},
                {"\x1b[1~", key_type::home},
                {"\x1b[2~", key_type::insert},
                {"\x1b[3~", key_type::del},
                {"\x1b[4~", key_type::end},
                {"\x1b[5~", key_type::page_up},
                {"\x1b[6~", key_type::page_down},
                {"\x1b[7~", key_type::home},
                {"\x1b[8~", key_type::end},
                {"\x1bOP", key_type::f1},
                {"\x1bOQ", key_type::f2},
                {"\x1bOR", key_type::f3},
                {"\x1bOS", key_type::f4},
                {"\x1b[11~", key_type::f1},
                {"\x1b[12~", key_type::f2},
                {"\x1b[13~", key_type::f3},
                {"\x1b[14~", key_type::f4},
                {"\x1b[[A", key_type::f1},
                {"\x1b[[B", key_type::f2},
                {"\x1b[[C", key_type::f3},
                {"\x1b[[D", key_type::f4},
        };

        std::pair<std::string_view, key_type> const with_alt[] = {
                {"\x1b[1;3A", key_type::up},
                {"\x1b[1;3B", key_type::down},
                {"\x1b[1;3C", key_type::right},
                {"\x1b[1;3D", key_type::left},
                {"\x1b[1;3H", key_type::home},
                {"\x1b[1;3F", key_type::end},
                {"\x1b[2;3~", key_type::insert},
                {"\x1b[3;3~", key_type::del},
                {"\x1b[5;3~", key_type::page_up},
                {"\x1b[6;3~", key_type::page_down},
        };

        for (auto& [seq, type] : plain) {
            t.keys.emplace(std::string(seq), make_key(type));
            t.keys.emplace(ESC + std::string(seq), make_key(type, true));
        }

        for (auto& [seq, type] : with_alt) {
            t.keys.emplace(std::string(seq), make_key(type, true));
        }

        auto add_control = [&](int ch) {
            std::string seq(1, char(ch));
            t.keys.emplace(seq, make_key(control_key(ch)));
            t.keys.emplace(ESC + seq, make_key(control_key(ch), true));
        };

        for (int ch = 0x00; ch <= 0x1f; ++ch) {
            if (ch != ESC) { add_control(ch); }
        }
        add_control(0x7f);

        auto space = make_key(key_type::space);
        space.runes = U" ";
        t.keys.emplace(" ", space);

        space.alt = true;
        t.keys.emplace(std::string{ESC, ' '}, space);

        t.keys.emplace(std::string{ESC, ESC}, make_key(key_type::escape, true));

        std::set<size_t, std::greater<>> lengths;
        for (auto& entry : t.keys) { lengths.insert(entry.first.size()); }
        t.lengths.assign(lengths.begin(), lengths.end());

        return t;
    }();

    return table;
}

struct rune {
    char32_t code = 0;
    size_t width = 1;
    bool truncated = false;
    bool invalid = false;
};

rune decode_rune(std::string_view in, size_t offset)
{
    rune r;
    auto first = uint8_t(in[offset]);

    if (first < 0x80) {
        r.code = first;
        return r;
    }

    size_t size;
    char32_t min_value;

    if (first < 0xc0) {
        r.invalid = true;
        return r;
    } else if (first < 0xe0) {
        size = 2, min_value = 0x80, r.code = first & 0x1f;
    } else if (first < 0xf0) {
        size = 3, min_value = 0x800, r.code = first & 0x0f;
    } else if (first < 0xf8) {
        size = 4, min_value = 0x10000, r.code = first & 0x07;
    } else {
        r.invalid = true;
        return r;
    }

    for (size_t i = 1; i < size; ++i) {
        if (offset + i >= in.size()) {
            r.truncated = true;
            return r;
        }

        auto byte = uint8_t(in[offset + i]);
        if ((byte & 0xc0) != 0x80) {
            r.invalid = true;
            return r;
        }

        r.code = (r.code << 6) | (byte & 0x3f);
    }

    if (r.code < min_value || r.code > 0x10ffff || (r.code >= 0xd800 && r.code <= 0xdfff)) {
        r.invalid = true;
        return r;
    }

    r.width = size;
    return r;
}

/**
 * Length of control sequence at the beginning of input, which starts with "ESC [".
 * Zero if the sequence is not complete yet, npos if it's malformed.
 */
size_t scan_csi(std::string_view in)
{
    size_t i = 2;
    while (i < in.size() && in[i] >= 0x30 && in[i] <= 0x3f) { ++i; }
    while (i < in.size() && in[i] >= 0x20 && in[i] <= 0x2f) { ++i; }

    if (i == in.size()) { return 0; }
    if (in[i] >= 0x40 && in[i] <= 0x7e) { return i + 1; }
    return std::string_view::npos;
}

detect_result detect_one(std::string_view in, bool more_data, bool final)
{
    if (starts_with(in, FOCUS_IN)) { return {FOCUS_IN.size(), focus_msg{}}; }
    if (starts_with(in, FOCUS_OUT)) { return {FOCUS_OUT.size(), blur_msg{}}; }

    if (starts_with(in, PASTE_BEGIN)) {
        auto end = in.find(PASTE_END, PASTE_BEGIN.size());
        if (end == std::string_view::npos) {
            if (not final) { return {}; }
            return {in.size(), paste_msg{std::string(in.substr(PASTE_BEGIN.size()))}};
        }

        auto content = in.substr(PASTE_BEGIN.size(), end - PASTE_BEGIN.size());
        return {end + PASTE_END.size(), paste_msg{std::string(content)}};
    }

    auto& table = sequences();
    for (auto length : table.lengths) {
        if (length > in.size()) { continue; }

        auto it = table.keys.find(std::string(in.substr(0, length)));
        if (it != table.keys.end()) { return {length, it->second}; }
    }

    if (in.size() >= 2 && in[0] == ESC && in[1] == '[') {
        auto length = scan_csi(in);

        if (length == 0) {
            if (not final && in.size() < MAX_PENDING_SEQUENCE) { return {}; }
            return {in.size(), unknown_sequence_msg{std::string(in)}};
        }

        if (length != std::string_view::npos) {
            return {length, unknown_sequence_msg{std::string(in.substr(0, length))}};
        }
    }

    if (in == "\x1bO" && more_data && not final) { return {}; }

    bool alt = false;
    size_t offset = 0;

    if (in[0] == ESC) {
        if (in.size() == 1) {
            if (more_data && not final) { return {}; }
            return {1, make_key(key_type::escape)};
        }

        alt = true;
        offset = 1;
    }

    auto key = make_key(key_type::runes, alt);
    while (offset < in.size()) {
        auto r = decode_rune(in, offset);

        if (r.truncated) {
            if (key.runes.empty() && not final) { return {}; }
            break;
        }

        if (r.invalid || r.code < 0x20 || r.code == 0x7f || r.code == ' ') { break; }

        key.runes.push_back(r.code);
        offset += r.width;

        if (alt) { break; }
    }

    if (offset >= in.size() && more_data && not final) { return {}; }
    if (not key.runes.empty()) { return {offset, std::move(key)}; }

    // leading ESC which doesn't prefix anything decodable
    if (alt) { return {1, make_key(key_type::escape)}; }

    return {1, unknown_sequence_msg{std::string(in.substr(0, 1))}};
}
}  // namespace

void teakit::basic_input_decoder::feed(std::string_view chunk, bool more_data, emit_fn const& emit)
{
    _pending.append(chunk);
    _consume(more_data, false, emit);
}

void teakit::basic_input_decoder::flush(emit_fn const& emit)
{
    _consume(false, true, emit);
    _pending.clear();
}

void teakit::basic_input_decoder::_consume(bool more_data, bool final, emit_fn const& emit)
{
    size_t offset = 0;

    while (offset < _pending.size()) {
        auto result = detect_one(std::string_view{_pending}.substr(offset), more_data, final);
        if (result.width == 0) { break; }

        offset += result.width;
        if (result.message) { emit(std::move(result.message)); }
    }

    _pending.erase(0, offset);
}
