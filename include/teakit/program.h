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
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

#include "teakit/detail/commands.hpp"
#include "teakit/detail/messages.hpp"
#include "teakit/detail/options.hpp"
#include "teakit/fwd.hpp"

namespace teakit {
/** Program was stopped by kill() */
struct program_killed_error : std::runtime_error {
    program_killed_error() : std::runtime_error("program was killed") {}
};

/** Program was stopped by interrupt signal */
struct program_interrupted_error : std::runtime_error {
    program_interrupted_error() : std::runtime_error("program was interrupted") {}
};

/**
 * Model threw an exception. Original exception is nested, retrieve it with
 * std::rethrow_if_nested().
 */
struct program_panic_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct update_result {
    /** Model to continue with. Null keeps current one. */
    model_ptr model;

    /** Follow-up command. May be empty. */
    cmd command;
};

/**
 * State machine driven by program.
 *
 * Every method is invoked from the thread which called program::run().
 */
class if_model : public std::enable_shared_from_this<if_model>
{
   public:
    virtual ~if_model() = default;

    /**
     * Invoked once on startup. Returned command is launched right away.
     */
    virtual cmd init() = 0;

    virtual update_result update(msg const& message) = 0;

    /**
     * Renders current state. Invoked after startup and after every update.
     */
    virtual std::string view() = 0;
};

struct run_result {
    /** Model at the moment program stopped */
    model_ptr model;

    /** Null on graceful quit */
    std::exception_ptr err;

    explicit operator bool() const noexcept { return not err; }
};

enum class program_state {
    initializing,
    running,
    quitting,
    stopped,
};

char const* to_string(program_state state) noexcept;

/**
 * Event loop which drives a model.
 *
 * Messages from terminal input, commands, resize/OS signals and external send() calls are
 * serialized into the single loop; the model is updated with one message at a time, and
 * rendered after every update.
 *
 * suspend_msg, from teakit::suspend() or SIGTSTP, hands the terminal back and stops the
 * process; the model receives resume_msg once it is continued.
 *
 * @code
 *   teakit::program app{std::make_shared<my_model>()};
 *   auto [model, err] = app.run();
 * @endcode
 */
class program
{
   public:
    explicit program(model_ptr model, program_options options = {});
    ~program();

    program(program const&) = delete;
    program& operator=(program const&) = delete;

   public:
    /**
     * Runs program until it quits. Calling thread becomes the loop.
     *
     * Setup failure, input stream failure, kill or interrupt are returned as err.
     * Model exceptions are returned as program_panic_error, or rethrown after terminal
     * is restored if settings.catch_panics is off.
     *
     * @throw std::logic_error if the program already ran
     */
    run_result run();

    /**
     * Requests graceful quit. Thread safe.
     */
    void quit();

    /**
     * Injects a message into the loop. Thread safe. Ignored once the program is quitting.
     */
    void send(msg message);

    /**
     * Stops the program immediately, with program_killed_error. Thread safe, so it may be
     * wired to any outer cancellation source.
     */
    void kill();

    program_state state() const noexcept;

   private:
    struct impl;
    std::unique_ptr<impl> _self;
};
}  // namespace teakit
