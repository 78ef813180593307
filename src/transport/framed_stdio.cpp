// src/transport/framed_stdio.cpp
#include "framed_stdio.hpp"

namespace transport
{

    static uint32_t decode_u32_le(const uint8_t b[4])
    {
        return (static_cast<uint32_t>(b[0])) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    static void encode_u32_le(uint32_t v, uint8_t b[4])
    {
        for (int i = 0; i < 4; ++i)
        {
            b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }

    // Reads up to n bytes; returns how many arrived before EOF/failure
    static size_t read_some(std::istream &in, uint8_t *buf, size_t n)
    {
        size_t got = 0;
        while (got < n && in)
        {
            in.read(reinterpret_cast<char *>(buf + got), static_cast<std::streamsize>(n - got));
            const std::streamsize r = in.gcount();
            if (r <= 0)
            {
                break;
            }
            got += static_cast<size_t>(r);
        }
        return got;
    }

    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err, uint32_t max_len)
    {
        err.clear();
        out.clear();

        uint8_t hdr[4] = {0, 0, 0, 0};
        const size_t hdr_got = read_some(in, hdr, sizeof(hdr));
        if (hdr_got == 0)
        {
            if (in.bad())
            {
                err = "stream failure while reading frame header";
                return ReadStatus::Error;
            }
            return ReadStatus::Eof;
        }
        if (hdr_got < sizeof(hdr))
        {
            err = "unexpected EOF in frame header (" + std::to_string(hdr_got) + " of 4 bytes)";
            return ReadStatus::Error;
        }

        const uint32_t len = decode_u32_le(hdr);
        if (len == 0)
        {
            err = "invalid frame length: 0";
            return ReadStatus::Error;
        }
        if (len > max_len)
        {
            err = "frame length " + std::to_string(len) + " exceeds max " + std::to_string(max_len);
            return ReadStatus::Error;
        }

        out.resize(len);
        const size_t got = read_some(in, out.data(), len);
        if (got < len)
        {
            err = "unexpected EOF in frame payload (" + std::to_string(got) + " of " +
                  std::to_string(len) + " bytes)";
            out.clear();
            return ReadStatus::Error;
        }
        return ReadStatus::Frame;
    }

    bool write_frame(std::ostream &out, const std::string &payload, std::string &err, uint32_t max_len)
    {
        err.clear();

        if (payload.empty())
        {
            err = "invalid frame length: 0";
            return false;
        }
        if (payload.size() > max_len)
        {
            err = "frame length " + std::to_string(payload.size()) + " exceeds max " +
                  std::to_string(max_len);
            return false;
        }

        uint8_t hdr[4];
        encode_u32_le(static_cast<uint32_t>(payload.size()), hdr);

        out.write(reinterpret_cast<const char *>(hdr), sizeof(hdr));
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out.good())
        {
            err = "failed writing frame";
            return false;
        }
        return true;
    }

    FrameWriter::FrameWriter(std::ostream &out, uint32_t max_len)
        : out_(out), max_len_(max_len)
    {
    }

    bool FrameWriter::write(const std::string &payload, std::string &err)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failed_)
        {
            err = "output stream already failed";
            return false;
        }
        if (!write_frame(out_, payload, err, max_len_))
        {
            // An oversized payload leaves the stream usable
            failed_ = !out_.good();
            return false;
        }
        return true;
    }

    bool FrameWriter::failed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_;
    }

} // namespace transport
