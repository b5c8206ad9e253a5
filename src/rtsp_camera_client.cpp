/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include <H264VideoRTPSource.hh>
#include <liveMedia.hh>

#include "decoder.hpp"
#include "rtsp_camera_client.hpp"

using namespace tapocam;

static constexpr size_t receive_buffer_size = 2'000'000;
static constexpr std::array<uint8_t, 4> start_code { 0x00, 0x00, 0x00, 0x01 };

static std::vector<uint8_t> decode_sprop_parameters(std::initializer_list<char const*> sprop_strings);

static UsageEnvironment& operator<<(UsageEnvironment& env, MediaSubsession const& subsession)
{
    return env << subsession.mediumName() << "/" << subsession.codecName();
}

// Receives NAL units of one video subsession and feeds them, prefixed with an
// Annex B start code, to the decoder.
class VideoSink : public MediaSink {
public:
    static VideoSink* create(UsageEnvironment& env,
        MediaSubsession& subsession,
        VideoCodec codec,
        FrameExchange& exchange,
        bool trace)
    {
        return new VideoSink(env, subsession, codec, exchange, trace);
    }

private:
    VideoSink(UsageEnvironment& env,
        MediaSubsession& subsession,
        VideoCodec codec,
        FrameExchange& exchange,
        bool trace);

    static void after_getting_frame(void* client_data,
        unsigned frame_size,
        unsigned num_truncated_bytes,
        struct timeval presentation_time,
        unsigned duration_in_microseconds);

    void after_getting_frame(unsigned frame_size, unsigned num_truncated_bytes);

    virtual Boolean continuePlaying() override;

    MediaSubsession& subsession_;
    VideoCodec codec_;
    FrameExchange& exchange_;
    bool trace_;
    std::vector<uint8_t> receive_buffer_;
    bool waiting_for_parameter_set_;
    Decoder decoder_;
};

static std::vector<uint8_t> subsession_extradata(MediaSubsession& subsession, VideoCodec codec)
{
    if (codec == VideoCodec::H264) {
        return decode_sprop_parameters({ subsession.fmtp_spropparametersets() });
    }
    return decode_sprop_parameters(
        { subsession.fmtp_spropvps(), subsession.fmtp_spropsps(), subsession.fmtp_sproppps() });
}

VideoSink::VideoSink(UsageEnvironment& env,
    MediaSubsession& subsession,
    VideoCodec codec,
    FrameExchange& exchange,
    bool trace)
    : MediaSink(env)
    , subsession_(subsession)
    , codec_(codec)
    , exchange_(exchange)
    , trace_(trace)
    , receive_buffer_(receive_buffer_size + start_code.size())
    , waiting_for_parameter_set_(true)
    , decoder_(codec, exchange, {}, trace)
{
    std::copy(start_code.begin(), start_code.end(), receive_buffer_.begin());

    // Parameter sets announced in the SDP go in first, as if they had been
    // received in-band.
    auto extradata = subsession_extradata(subsession, codec);
    if (!extradata.empty()) {
        decoder_.send({ extradata.data(), extradata.size() });
        waiting_for_parameter_set_ = false;
    }
}

void VideoSink::after_getting_frame(void* client_data,
    unsigned frame_size,
    unsigned num_truncated_bytes,
    struct timeval /*presentation_time*/,
    unsigned /*duration_in_microseconds*/)
{
    static_cast<VideoSink*>(client_data)->after_getting_frame(frame_size, num_truncated_bytes);
}

void VideoSink::after_getting_frame(unsigned frame_size, unsigned num_truncated_bytes)
{
    if (num_truncated_bytes != 0 && trace_) {
        envir() << subsession_ << ": " << num_truncated_bytes << " bytes truncated\n";
    }

    auto nal_header = receive_buffer_[start_code.size()];
    if (waiting_for_parameter_set_ && is_parameter_set(codec_, nal_header)) {
        waiting_for_parameter_set_ = false;
    }

    if (!waiting_for_parameter_set_) {
        try {
            decoder_.send({ receive_buffer_.data(), frame_size + start_code.size() });
        } catch (std::exception const& e) {
            exchange_.set_failed(std::string("decoding failed: ") + e.what());
            return;
        }
    }

    continuePlaying();
}

Boolean VideoSink::continuePlaying()
{
    if (fSource == nullptr) {
        return False;
    }

    fSource->getNextFrame(&receive_buffer_[start_code.size()], receive_buffer_size,
        after_getting_frame, this, onSourceClosure, this);
    return True;
}

// RtspCameraClient

RtspCameraClient::Ptr RtspCameraClient::create(UsageEnvironment& environment,
    std::string const& rtsp_url,
    FrameExchange& exchange,
    RtspOptions const& options)
{
    return Ptr(new RtspCameraClient(environment, rtsp_url, exchange, options));
}

RtspCameraClient::RtspCameraClient(UsageEnvironment& environment,
    std::string const& rtsp_url,
    FrameExchange& exchange,
    RtspOptions const& options)
    : RTSPClient(environment, rtsp_url.c_str(), options.trace_ ? 1 : 0, "tapocam", 0, -1)
    , exchange_(exchange)
    , options_(options)
    , quit_flag_(0)
    , already_shut_down_(false)
    , session_(nullptr)
    , subsession_iterator_(nullptr)
    , subsession_(nullptr)
{
    quit_trigger_ = envir().taskScheduler().createEventTrigger(on_quit_event);
    sendDescribeCommand(continue_after_describe);

    thread_ = std::thread([&env = envir(), quit_flag = &quit_flag_] {
        env.taskScheduler().doEventLoop(quit_flag);
    });
}

RtspCameraClient::~RtspCameraClient()
{
    delete subsession_iterator_;
    if (session_ != nullptr) {
        Medium::close(session_);
    }
}

void RtspCameraClient::quit()
{
    if (!thread_.joinable()) {
        return;
    }
    envir().taskScheduler().triggerEvent(quit_trigger_, this);
    thread_.join();
    envir().taskScheduler().deleteEventTrigger(quit_trigger_);
}

void RtspCameraClient::on_quit_event(void* client_data)
{
    auto* self = static_cast<RtspCameraClient*>(client_data);
    self->shutdown("stream closed");
    self->quit_flag_ = 1;
}

void RtspCameraClient::continue_after_describe(RTSPClient* rtsp_client,
    int result_code,
    char* result_string)
{
    auto& client = *static_cast<RtspCameraClient*>(rtsp_client);
    UsageEnvironment& env = client.envir();

    if (result_code != 0) {
        std::ostringstream os;
        os << "Failed to get a SDP description";
        if (result_code > 0) {
            os << " (RTSP " << result_code << ")";
        }
        if (result_string != nullptr) {
            os << ": " << result_string;
        }
        delete[] result_string;
        client.shutdown(os.str());
        return;
    }

    client.session_ = MediaSession::createNew(env, result_string);
    delete[] result_string;
    if (client.session_ == nullptr) {
        client.shutdown(std::string("Failed to create a MediaSession object from the SDP description: ")
            + env.getResultMsg());
        return;
    }
    if (client.session_->hasSubsessions() == False) {
        client.shutdown("The session has no media subsessions");
        return;
    }

    client.subsession_iterator_ = new MediaSubsessionIterator(*client.session_);
    client.setup_next_subsession();
}

void RtspCameraClient::setup_next_subsession()
{
    UsageEnvironment& env = envir();

    while ((subsession_ = subsession_iterator_->next()) != nullptr) {
        if (std::strcmp(subsession_->mediumName(), "video") != 0
            || !codec_from_rtp_name(subsession_->codecName())) {
            continue;
        }
        if (subsession_->initiate() == False) {
            if (options_.trace_) {
                env << "Failed to initiate the \"" << *subsession_ << "\" subsession: "
                    << env.getResultMsg() << "\n";
            }
            continue;
        }

        sendSetupCommand(*subsession_, continue_after_setup, False, options_.over_tcp_ ? True : False);
        return;
    }

    shutdown("No usable H.264/H.265 video subsession");
}

void RtspCameraClient::continue_after_setup(RTSPClient* rtsp_client, int result_code, char* result_string)
{
    auto& client = *static_cast<RtspCameraClient*>(rtsp_client);
    UsageEnvironment& env = client.envir();
    MediaSubsession& subsession = *client.subsession_;

    if (result_code != 0) {
        if (client.options_.trace_) {
            env << "Failed to set up the \"" << subsession << "\" subsession: "
                << (result_string ? result_string : "") << "\n";
        }
        delete[] result_string;
        client.setup_next_subsession();
        return;
    }
    delete[] result_string;

    auto codec = codec_from_rtp_name(subsession.codecName());
    try {
        subsession.sink = VideoSink::create(env, subsession, *codec, client.exchange_, client.options_.trace_);
    } catch (std::exception const& e) {
        client.shutdown(std::string("Failed to create a video sink: ") + e.what());
        return;
    }

    if (client.options_.trace_) {
        env << "Set up the \"" << subsession << "\" subsession (client port "
            << subsession.clientPortNum() << ")\n";
    }

    // lets the subsession handlers get at the client
    subsession.miscPtr = rtsp_client;
    subsession.sink->startPlaying(*subsession.readSource(), subsession_after_playing, &subsession);
    if (subsession.rtcpInstance() != nullptr) {
        subsession.rtcpInstance()->setByeWithReasonHandler(subsession_bye, &subsession);
    }

    client.sendPlayCommand(*client.session_, continue_after_play);
}

void RtspCameraClient::continue_after_play(RTSPClient* rtsp_client, int result_code, char* result_string)
{
    auto& client = *static_cast<RtspCameraClient*>(rtsp_client);

    if (result_code != 0) {
        std::string reason = "Failed to start playing session";
        if (result_string != nullptr) {
            reason += std::string(": ") + result_string;
        }
        delete[] result_string;
        client.shutdown(reason);
        return;
    }
    delete[] result_string;

    if (client.options_.trace_) {
        client.envir() << "Started playing session...\n";
    }
    client.exchange_.set_playing();
}

void RtspCameraClient::subsession_after_playing(void* client_data)
{
    auto* subsession = static_cast<MediaSubsession*>(client_data);
    auto& client = *static_cast<RtspCameraClient*>(subsession->miscPtr);

    Medium::close(subsession->sink);
    subsession->sink = nullptr;

    client.shutdown("The stream ended");
}

void RtspCameraClient::subsession_bye(void* client_data, char const* reason)
{
    auto* subsession = static_cast<MediaSubsession*>(client_data);
    auto& client = *static_cast<RtspCameraClient*>(subsession->miscPtr);

    if (client.options_.trace_) {
        client.envir() << "Received RTCP \"BYE\"" << (reason ? " (reason: " : "")
                       << (reason ? reason : "") << (reason ? ")" : "") << "\n";
    }
    delete[] (char*)reason;

    subsession_after_playing(subsession);
}

void RtspCameraClient::shutdown(std::string const& reason)
{
    if (already_shut_down_) {
        return;
    }
    already_shut_down_ = true;

    if (session_ != nullptr) {
        bool some_subsessions_were_active = false;
        MediaSubsessionIterator iter(*session_);
        MediaSubsession* subsession;

        while ((subsession = iter.next()) != nullptr) {
            if (subsession->sink != nullptr) {
                Medium::close(subsession->sink);
                subsession->sink = nullptr;

                if (subsession->rtcpInstance() != nullptr) {
                    // the server may send a "BYE" while handling "TEARDOWN"
                    subsession->rtcpInstance()->setByeHandler(nullptr, nullptr);
                }
                some_subsessions_were_active = true;
            }
        }

        if (some_subsessions_were_active) {
            sendTeardownCommand(*session_, nullptr);
        }
    }

    if (options_.trace_) {
        envir() << "Closing the stream: " << reason.c_str() << "\n";
    }
    exchange_.set_failed(reason);
}

static std::vector<uint8_t> decode_sprop_parameters(std::initializer_list<char const*> sprop_strings)
{
    std::vector<uint8_t> buffer;

    for (auto const* sprop_string : sprop_strings) {
        if (sprop_string == nullptr || *sprop_string == '\0') {
            continue;
        }

        unsigned num_records = 0;
        auto* records = parseSPropParameterSets(sprop_string, num_records);
        for (unsigned i = 0; i < num_records; i++) {
            if (records[i].sPropLength == 0) {
                continue;
            }
            buffer.insert(buffer.end(), start_code.begin(), start_code.end());
            buffer.insert(buffer.end(), records[i].sPropBytes,
                records[i].sPropBytes + records[i].sPropLength);
        }
        delete[] records;
    }

    return buffer;
}
