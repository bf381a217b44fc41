#ifndef TOOLWIRE_SERVER_LOOP_HPP
#define TOOLWIRE_SERVER_LOOP_HPP

// Stdio server loop: read request envelopes from input, dispatch them, write
// response envelopes to output. Runs until end-of-input or a stop signal.

#include <cstddef>
#include <iosfwd>

#include "server/tool_dispatch.hpp"

namespace server_loop {

struct LoopStatistics {
    size_t messages_received = 0;
    size_t responses_written = 0;
    size_t requests_dropped = 0;
    size_t requests_rejected = 0;
};

// Install SIGINT/SIGTERM handlers that make run() stop after the current message.
void install_signal_handlers();

// True once a stop signal was received.
bool stop_requested();

// Process messages until EOF, a failed write, or a stop signal.
LoopStatistics run(const tool_dispatch::Dispatcher &dispatcher, std::istream &input, std::ostream &output);

// Same, reading raw bytes from a file descriptor. A stop signal interrupts a
// blocked read, so an idle server shuts down without further input.
LoopStatistics run(const tool_dispatch::Dispatcher &dispatcher, int input_fd, std::ostream &output);

} // namespace server_loop

#endif // TOOLWIRE_SERVER_LOOP_HPP
