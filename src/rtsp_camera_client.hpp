/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <memory>
#include <string>
#include <thread>

#include <liveMedia.hh>

#include "frame_exchange.hpp"
#include "rtsp_camera.hpp"

namespace tapocam {

// Drives one RTSP session (DESCRIBE, SETUP of the first H.264/H.265 video
// subsession, PLAY) on its own live555 event loop thread and feeds received
// NAL units to a decoder. Progress and failures are reported through the
// FrameExchange.
class RtspCameraClient : public RTSPClient {
public:
    struct Deleter {
        void operator()(RtspCameraClient* p) const { Medium::close(p); }
    };

    using Ptr = std::unique_ptr<RtspCameraClient, Deleter>;

    static Ptr create(UsageEnvironment& environment,
        std::string const& rtsp_url,
        FrameExchange& exchange,
        RtspOptions const& options);

    virtual ~RtspCameraClient() override;

    // Tears the session down and joins the event loop thread.
    void quit();

private:
    RtspCameraClient(UsageEnvironment& environment,
        std::string const& rtsp_url,
        FrameExchange& exchange,
        RtspOptions const& options);

    static void on_quit_event(void* client_data);
    static void continue_after_describe(RTSPClient* rtsp_client, int result_code, char* result_string);
    static void continue_after_setup(RTSPClient* rtsp_client, int result_code, char* result_string);
    static void continue_after_play(RTSPClient* rtsp_client, int result_code, char* result_string);
    static void subsession_after_playing(void* client_data);
    static void subsession_bye(void* client_data, char const* reason);

    void setup_next_subsession();
    void shutdown(std::string const& reason);

    FrameExchange& exchange_;
    RtspOptions options_;
    std::thread thread_;
    EventTriggerId quit_trigger_;
    char volatile quit_flag_;
    bool already_shut_down_;
    MediaSession* session_;
    MediaSubsessionIterator* subsession_iterator_;
    MediaSubsession* subsession_;
};

} // namespace tapocam
