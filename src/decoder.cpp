/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "decoder.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

extern "C" {
#include <libavutil/pixdesc.h>
}

using namespace tapocam;

std::optional<VideoCodec> tapocam::codec_from_rtp_name(char const* name)
{
    if (name == nullptr) {
        return {};
    }
    if (std::strcmp(name, "H264") == 0) {
        return VideoCodec::H264;
    }
    if (std::strcmp(name, "H265") == 0) {
        return VideoCodec::H265;
    }
    return {};
}

bool tapocam::is_parameter_set(VideoCodec codec, uint8_t nal_header)
{
    switch (codec) {
    case VideoCodec::H264:
        return (nal_header & 0x1f) == 7;
    case VideoCodec::H265: {
        int type = (nal_header >> 1) & 0x3f;
        return type == 32 || type == 33;
    }
    }
    return false;
}

Decoder::Decoder(VideoCodec codec_id, FrameExchange& exchange, Slice extradata, bool verbose)
    : frame_(make_videoframe())
    , packet_(av_packet_alloc())
    , exchange_(exchange)
    , first_frame_(true)
    , verbose_(verbose)
{
    AVCodecID id = codec_id == VideoCodec::H264 ? AV_CODEC_ID_H264 : AV_CODEC_ID_HEVC;

    AVCodec const* codec = avcodec_find_decoder(id);
    if (!codec) {
        throw std::runtime_error(std::string("decoder not found: ") + avcodec_get_name(id));
    }

    if (!frame_ || !packet_) {
        throw std::runtime_error("failed to allocate decoder buffers");
    }

    parser_context_ = ParserContextPtr(av_parser_init(codec->id));
    if (!parser_context_) {
        throw std::runtime_error("failed to initialize parser");
    }

    codec_context_ = CodecContextPtr(avcodec_alloc_context3(codec));
    if (!codec_context_) {
        throw std::runtime_error("failed to allocate codec context");
    }

    if (extradata.size_ != 0) {
        codec_context_->extradata = (uint8_t*)av_mallocz(extradata.size_ + AV_INPUT_BUFFER_PADDING_SIZE);
        if (!codec_context_->extradata) {
            throw std::runtime_error("failed to allocate decoder extradata");
        }
        std::copy(extradata.data_, extradata.data_ + extradata.size_, codec_context_->extradata);
        codec_context_->extradata_size = (int)extradata.size_;
    }

    if (avcodec_open2(codec_context_.get(), codec, nullptr) != 0) {
        throw std::runtime_error("failed to open codec");
    }
}

void Decoder::send(Slice slice)
{
    auto* cur_ptr = slice.data_;
    auto cur_size = slice.size_;

    auto* parser_context = parser_context_.get();
    auto* codec_context = codec_context_.get();
    auto* packet = packet_.get();

    while (cur_size > 0) {
        int len = av_parser_parse2(parser_context, codec_context, &packet->data, &packet->size,
            cur_ptr, (int)cur_size, AV_NOPTS_VALUE, AV_NOPTS_VALUE, -1);
        if (len < 0) {
            throw std::runtime_error("failed to parse video data");
        }

        cur_ptr += len;
        cur_size -= len;

        if (packet->size == 0) {
            continue;
        }

        decode();
    }
}

void Decoder::decode()
{
    auto* codec_context = codec_context_.get();

    int ret = avcodec_send_packet(codec_context, packet_.get());
    if (ret == AVERROR_INVALIDDATA) {
        // typical until the first keyframe arrives
        return;
    }
    if (ret != 0) {
        throw std::runtime_error("Error sending a packet for decoding");
    }

    while (ret >= 0) {
        ret = avcodec_receive_frame(codec_context, frame_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return;
        }
        if (ret < 0) {
            throw std::runtime_error("Error during decoding");
        }

        if (first_frame_) {
            first_frame_ = false;
            if (verbose_) {
                std::cout << "codec full name: " << codec_context->codec->long_name << "\n"
                          << "width:           " << codec_context->width << "\n"
                          << "height:          " << codec_context->height << "\n"
                          << "pix_fmt:         " << av_get_pix_fmt_name(codec_context->pix_fmt)
                          << std::endl;
            }
        }

        frame_ = exchange_.push(std::move(frame_));
    }
}
