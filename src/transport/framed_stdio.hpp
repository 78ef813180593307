// src/transport/framed_stdio.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace transport
{

    // Frames larger than 1 MiB are rejected on both directions
    constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;

    enum class ReadStatus
    {
        Frame, // payload read
        Eof,   // clean end of stream between frames
        Error  // truncated frame, bad length or stream failure
    };

    // Reads one length-prefixed frame (uint32_le + payload bytes) into out.
    // On Error, err describes the problem.
    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                          uint32_t max_len = kMaxFrameBytes);

    // Writes one length-prefixed frame and flushes.
    // Returns false on error and sets err.
    bool write_frame(std::ostream &out, const std::string &payload, std::string &err,
                     uint32_t max_len = kMaxFrameBytes);

    // Serializes frame writes coming from several rule threads
    class FrameWriter
    {
    public:
        explicit FrameWriter(std::ostream &out, uint32_t max_len = kMaxFrameBytes);

        // Returns false and sets err on failure; later writes keep failing
        bool write(const std::string &payload, std::string &err);

        bool failed() const;

    private:
        std::ostream &out_;
        uint32_t max_len_;
        bool failed_ = false;
        mutable std::mutex mutex_;
    };

} // namespace transport
