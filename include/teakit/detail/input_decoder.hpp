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

#pragma once
#include <functional>
#include <string>
#include <string_view>

#include "teakit/detail/messages.hpp"

namespace teakit {
/**
 * Converts raw terminal input bytes into messages.
 */
class if_input_decoder
{
   public:
    using emit_fn = std::function<void(msg)>;

   public:
    virtual ~if_input_decoder() = default;

    /**
     * Decodes as many messages as possible from given chunk. Bytes which can't be decoded
     * yet are kept, and prepended to the next chunk.
     *
     * @param more_data Set if caller knows the chunk was cut in the middle of input.
     *                  Ambiguous trailing bytes (e.g. lone ESC) are held back then.
     */
    virtual void feed(std::string_view chunk, bool more_data, emit_fn const& emit) = 0;

    /**
     * Called on end of input. Remaining bytes must be emitted, or discarded.
     */
    virtual void flush(emit_fn const& emit) = 0;
};

/**
 * Decoder for VT/xterm compatible input.
 *
 * Produces key_msg for UTF-8 text, control keys, alt-prefixed keys and well-known
 * cursor/editing/function key sequences, focus_msg and blur_msg for focus reports,
 * paste_msg for bracketed paste, and unknown_sequence_msg for anything else.
 */
class basic_input_decoder : public if_input_decoder
{
   public:
    void feed(std::string_view chunk, bool more_data, emit_fn const& emit) override;
    void flush(emit_fn const& emit) override;

    /** Number of bytes held back from previous chunks */
    size_t num_pending() const noexcept { return _pending.size(); }

   private:
    void _consume(bool more_data, bool final, emit_fn const& emit);

   private:
    std::string _pending;
};
}  // namespace teakit
