#include "server/server_loop.hpp"
#include "protocol/envelope.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/framing.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <istream>
#include <ostream>
#include <signal.h>
#include <string>
#include <vector>

namespace server_loop {

namespace {

constexpr int kStopCheckMilliseconds = 200;

// Global flag for graceful shutdown.
volatile sig_atomic_t shutdown_requested = 0;

void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// Dispatch one message and write its response. Returns false if output is gone.
bool handle_message(const tool_dispatch::Dispatcher &dispatcher, const std::string &raw_message,
                    std::ostream &output, LoopStatistics &statistics) {
    statistics.messages_received++;

    tool_dispatch::DispatchResult result = dispatcher.dispatch(raw_message);
    if (result.stage == tool_dispatch::DispatchStage::Rejected) {
        statistics.requests_rejected++;
    }
    if (!result.has_response) {
        statistics.requests_dropped++;
        logging::debug(std::string("Message dropped at stage ") + tool_dispatch::stage_name(result.stage));
        return true;
    }

    if (!framing::write_message(output, envelope::serialize(result.response))) {
        logging::error("Failed to write response; output closed. Shutting down.");
        return false;
    }
    statistics.responses_written++;
    return true;
}

void log_discarded(const framing::FrameDecoder &decoder) {
    if (decoder.discarded_frames() > 0) {
        logging::warning("Discarded " + std::to_string(decoder.discarded_frames()) + " oversized message(s)");
    }
}

} // namespace

void install_signal_handlers() {
    // No SA_RESTART: a blocked read(2) on stdin fails with EINTR so the loop can
    // notice the flag.
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

bool stop_requested() {
    return shutdown_requested != 0;
}

LoopStatistics run(const tool_dispatch::Dispatcher &dispatcher, std::istream &input, std::ostream &output) {
    LoopStatistics statistics;
    framing::FrameDecoder decoder;
    std::string raw_message;

    while (!stop_requested()) {
        if (!framing::read_message(input, decoder, raw_message)) {
            if (stop_requested()) {
                logging::info("Stop signal received. Shutting down.");
            } else {
                // EOF on stdin means the client disconnected.
                logging::info("EOF on stdin. Shutting down.");
            }
            break;
        }
        if (!handle_message(dispatcher, raw_message, output, statistics)) {
            break;
        }
    }

    log_discarded(decoder);
    return statistics;
}

LoopStatistics run(const tool_dispatch::Dispatcher &dispatcher, int input_fd, std::ostream &output) {
    LoopStatistics statistics;
    framing::FrameDecoder decoder;
    std::vector<char> buffer(65536);
    std::vector<std::string> frames;

    while (true) {
        if (stop_requested()) {
            logging::info("Stop signal received. Shutting down.");
            break;
        }
        // Bounded wait, so a signal that lands just before poll() is still seen.
        int readable = platform::wait_readable(input_fd, kStopCheckMilliseconds);
        if (readable == 0 || (readable < 0 && errno == EINTR)) {
            continue;
        }
        if (readable < 0) {
            logging::error(std::string("Waiting for input failed: ") + std::strerror(errno));
            break;
        }
        ssize_t count = platform::read_once(input_fd, buffer.data(), buffer.size());
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count < 0) {
            logging::error(std::string("Read from input failed: ") + std::strerror(errno));
            break;
        }
        if (count == 0) {
            // EOF on stdin means the client disconnected.
            logging::info("EOF on stdin. Shutting down.");
            break;
        }

        frames.clear();
        decoder.feed(buffer.data(), static_cast<size_t>(count), frames);
        bool output_open = true;
        for (const auto &frame : frames) {
            output_open = handle_message(dispatcher, frame, output, statistics);
            if (!output_open) {
                break;
            }
        }
        if (!output_open) {
            break;
        }
    }

    log_discarded(decoder);
    return statistics;
}

} // namespace server_loop
