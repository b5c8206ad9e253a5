/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "av_handles.hpp"
#include "frame_exchange.hpp"

namespace tapocam {

enum class VideoCodec {
    H264,
    H265,
};

// Maps an RTP payload format name ("H264", "H265") to a codec we decode.
std::optional<VideoCodec> codec_from_rtp_name(char const* name);

// True if `nal_header` (first byte after the start code) opens a parameter set
// a decoder needs before the first picture (SPS for H.264, VPS/SPS for H.265).
bool is_parameter_set(VideoCodec codec, uint8_t nal_header);

struct Slice {
    Slice()
        : data_(nullptr)
        , size_(0)
    {
    }

    Slice(uint8_t const* data, size_t size)
        : data_(data)
        , size_(size)
    {
    }

    uint8_t const* const data_;
    size_t const size_;
};

// Decodes an Annex B elementary stream. Runs on the live555 event loop
// thread; every decoded picture is pushed to the frame exchange.
class Decoder {
public:
    Decoder(VideoCodec codec, FrameExchange& exchange, Slice extradata = {}, bool verbose = false);
    void send(Slice slice);

private:
    CodecContextPtr codec_context_;
    ParserContextPtr parser_context_;
    VideoFramePtr frame_;
    PacketPtr packet_;
    FrameExchange& exchange_;
    bool first_frame_;
    bool verbose_;

    void decode();
};

} // namespace tapocam
