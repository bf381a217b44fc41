#ifndef TOOLWIRE_FRAMING_HPP
#define TOOLWIRE_FRAMING_HPP

// Message framing over a byte stream.
// Uses brace-counting with string/escape awareness, so it works both with
// newline-delimited and streamed JSON. Writers always emit one object per line.

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace framing {

// Frames larger than this are discarded and the decoder resynchronizes on the
// end of the oversized object.
constexpr size_t MAX_FRAME_BYTES = 64u * 1024u * 1024u;

class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_frame_bytes = MAX_FRAME_BYTES);

    // Consume one byte. Returns true when it completed a frame, which is moved
    // into output_frame.
    bool feed_byte(char character, std::string &output_frame);

    // Consume a chunk, appending every frame it completes.
    void feed(const char *data, size_t length, std::vector<std::string> &output_frames);

    // True while an object has started but not yet closed.
    bool has_partial_frame() const;

    // Number of oversized frames dropped so far.
    size_t discarded_frames() const;

private:
    size_t max_frame_bytes_;
    std::string buffer_;
    int brace_depth_ = 0;
    bool inside_string_ = false;
    bool escape_next_ = false;
    bool started_ = false;
    bool skipping_oversized_ = false;
    size_t discarded_frames_ = 0;
};

// Read a single complete JSON object from the stream.
// Returns false on EOF / stream error before a complete object was read.
bool read_message(std::istream &input, FrameDecoder &decoder, std::string &output_message);

// Append the line terminator to a serialized envelope.
std::string encode_frame(const std::string &serialized_message);

// Write one frame and flush. Concurrent writers to the same stream never
// interleave. Returns false if the stream is in a failed state afterwards.
bool write_message(std::ostream &output, const std::string &serialized_message);

} // namespace framing

#endif // TOOLWIRE_FRAMING_HPP
