#include "protocol/framing.hpp"

#include <istream>
#include <mutex>
#include <ostream>

namespace framing {

FrameDecoder::FrameDecoder(size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

bool FrameDecoder::feed_byte(char character, std::string &output_frame) {
    // Skip anything before the opening brace (whitespace, newlines, stray text).
    if (!started_) {
        if (character == '{') {
            started_ = true;
            brace_depth_ = 1;
            inside_string_ = false;
            escape_next_ = false;
            buffer_ += character;
        }
        return false;
    }

    if (!skipping_oversized_) {
        buffer_ += character;
        if (buffer_.size() > max_frame_bytes_) {
            skipping_oversized_ = true;
            buffer_.clear();
            buffer_.shrink_to_fit();
        }
    }

    if (escape_next_) {
        escape_next_ = false;
        return false;
    }

    if (character == '\\' && inside_string_) {
        escape_next_ = true;
        return false;
    }

    if (character == '"') {
        inside_string_ = !inside_string_;
        return false;
    }

    if (inside_string_) {
        return false;
    }

    if (character == '{') {
        brace_depth_++;
    } else if (character == '}') {
        brace_depth_--;
        if (brace_depth_ == 0) {
            started_ = false;
            if (skipping_oversized_) {
                skipping_oversized_ = false;
                discarded_frames_++;
                return false;
            }
            output_frame = std::move(buffer_);
            buffer_.clear();
            return true;
        }
    }
    return false;
}

void FrameDecoder::feed(const char *data, size_t length, std::vector<std::string> &output_frames) {
    std::string frame;
    for (size_t index = 0; index < length; index++) {
        if (feed_byte(data[index], frame)) {
            output_frames.push_back(std::move(frame));
            frame.clear();
        }
    }
}

bool FrameDecoder::has_partial_frame() const {
    return started_;
}

size_t FrameDecoder::discarded_frames() const {
    return discarded_frames_;
}

bool read_message(std::istream &input, FrameDecoder &decoder, std::string &output_message) {
    char character;
    while (input.get(character)) {
        if (decoder.feed_byte(character, output_message)) {
            return true;
        }
    }
    // EOF reached without a complete message.
    return false;
}

std::string encode_frame(const std::string &serialized_message) {
    std::string frame;
    frame.reserve(serialized_message.size() + 1);
    frame += serialized_message;
    frame += '\n';
    return frame;
}

bool write_message(std::ostream &output, const std::string &serialized_message) {
    static std::mutex write_mutex;
    std::lock_guard<std::mutex> lock(write_mutex);
    output << encode_frame(serialized_message);
    output.flush();
    return output.good();
}

} // namespace framing
