/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include <getopt.h>

#include <opencv2/imgcodecs.hpp>

#include "capture_orchestrator.hpp"
#include "errors.hpp"

using namespace tapocam;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_capture_failed = 1;
constexpr int exit_usage = 2;

volatile std::sig_atomic_t stop_requested = 0;

void on_signal(int)
{
    stop_requested = 1;
}

void print_usage(char const* program)
{
    std::cout << "Tapo camera image capture\n"
              << "\nUsage:\n"
              << "  " << program << " <ip> <username> <password> [options]\n"
              << "\nOptions:\n"
              << "  -o, --output PATH        output file (default: tapo_capture_<ip>_<time>.<ext>)\n"
              << "  -f, --format FORMAT      PNG, TIFF or BMP (default: PNG)\n"
              << "  -m, --method METHOD      auto, rtsp or http (default: auto)\n"
              << "  -c, --continuous SECONDS capture every SECONDS until interrupted\n"
              << "      --port PORT          RTSP port (default: 554)\n"
              << "      --tcp                request RTP over TCP\n"
              << "      --refresh-token      log in again when the session token expired\n"
              << "      --trace-rtsp         print RTSP session diagnostics\n"
              << "  -q, --quiet              print only the result\n"
              << "\nExamples:\n"
              << "  " << program << " 192.168.1.100 admin password123\n"
              << "  " << program << " 192.168.1.100 admin password123 -f TIFF -o my_image.tiff\n"
              << "  " << program << " 192.168.1.100 admin password123 --continuous 30\n"
              << "\nLossless formats supported: PNG, TIFF, BMP\n"
              << "Methods: auto (tries RTSP then HTTP), rtsp, http" << std::endl;
}

struct Arguments {
    DeviceEndpoint endpoint_;
    std::string output_;
    OutputFormat format_ = OutputFormat::PNG;
    CaptureMethod method_ = CaptureMethod::Auto;
    std::chrono::seconds continuous_interval_ { 0 };
    CaptureSettings settings_;
};

Arguments parse_arguments(int argc, char* argv[])
{
    enum {
        opt_port = 1000,
        opt_tcp,
        opt_refresh_token,
        opt_trace_rtsp,
    };

    static option const long_options[] = {
        { "output", required_argument, nullptr, 'o' },
        { "format", required_argument, nullptr, 'f' },
        { "method", required_argument, nullptr, 'm' },
        { "continuous", required_argument, nullptr, 'c' },
        { "port", required_argument, nullptr, opt_port },
        { "tcp", no_argument, nullptr, opt_tcp },
        { "refresh-token", no_argument, nullptr, opt_refresh_token },
        { "trace-rtsp", no_argument, nullptr, opt_trace_rtsp },
        { "quiet", no_argument, nullptr, 'q' },
        { "help", no_argument, nullptr, 'h' },
        { nullptr, 0, nullptr, 0 },
    };

    Arguments args;
    args.settings_.verbose_ = true;

    int opt;
    while ((opt = getopt_long(argc, argv, "o:f:m:c:qh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'o':
            args.output_ = optarg;
            break;
        case 'f':
            args.format_ = parse_output_format(optarg);
            break;
        case 'm':
            args.method_ = parse_capture_method(optarg);
            break;
        case 'c':
            args.continuous_interval_ = parse_capture_interval(optarg);
            break;
        case opt_port:
            args.settings_.stream_.rtsp_port_ = parse_rtsp_port(optarg);
            break;
        case opt_tcp:
            args.settings_.stream_.over_tcp_ = true;
            break;
        case opt_refresh_token:
            args.settings_.http_.refresh_stale_token_ = true;
            break;
        case opt_trace_rtsp:
            args.settings_.stream_.trace_rtsp_ = true;
            break;
        case 'q':
            args.settings_.verbose_ = false;
            break;
        case 'h':
            print_usage(argv[0]);
            std::exit(exit_ok);
        default:
            throw ConfigurationError("unrecognized arguments");
        }
    }

    if (argc - optind != 3) {
        throw ConfigurationError("expected <ip> <username> <password>");
    }
    args.endpoint_ = { argv[optind], argv[optind + 1], argv[optind + 2] };
    return args;
}

CaptureResult capture_once(Arguments const& args, std::string const& output)
{
    if (args.settings_.verbose_) {
        std::cout << "Capturing image from " << args.endpoint_.address_ << "...\n"
                  << "Output: " << output << "\n"
                  << "Format: " << format_name(args.format_) << " (lossless)" << std::endl;
    }

    CaptureOrchestrator orchestrator(args.endpoint_, args.settings_);
    return orchestrator.capture(output, args.format_, args.method_);
}

void print_image_info(std::string const& path)
{
    auto image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        std::cout << "Could not read image info" << std::endl;
        return;
    }

    std::error_code ec;
    auto file_size = std::filesystem::file_size(path, ec);

    std::cout << "Image size: " << image.cols << "x" << image.rows << "\n"
              << "Channels: " << image.channels() << std::endl;
    if (!ec) {
        std::cout << "File size: " << file_size << " bytes" << std::endl;
    }
}

int run_continuous(Arguments const& args)
{
    std::cout << "Starting continuous capture every " << args.continuous_interval_.count() << " seconds...\n"
              << "Press Ctrl+C to stop" << std::endl;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    for (int counter = 1; !stop_requested; counter++) {
        std::cout << "\n--- Capture #" << counter << " ---" << std::endl;

        auto output = default_output_path(args.endpoint_.address_, args.format_);
        auto result = capture_once(args, output);
        if (result.success_) {
            std::cout << "Saved: " << result.output_path_ << std::endl;
        } else {
            std::cout << "Capture failed: " << result.message_ << std::endl;
        }

        auto wake_up = std::chrono::steady_clock::now() + args.continuous_interval_;
        while (!stop_requested && std::chrono::steady_clock::now() < wake_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    std::cout << "\nContinuous capture stopped by user" << std::endl;
    return exit_ok;
}

int run_single(Arguments const& args)
{
    auto output = args.output_.empty() ? default_output_path(args.endpoint_.address_, args.format_)
                                       : args.output_;

    auto result = capture_once(args, output);
    if (!result.success_) {
        std::cerr << "\n✗ Failed to capture image: " << result.message_ << std::endl;
        return exit_capture_failed;
    }

    std::cout << "\n✓ Image saved successfully: " << result.output_path_ << std::endl;
    if (args.settings_.verbose_) {
        print_image_info(result.output_path_);
    }
    return exit_ok;
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc == 1) {
        print_usage(argv[0]);
        return exit_ok;
    }

    Arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (ConfigurationError const& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n"
                  << "Run `" << argv[0] << " --help` for usage." << std::endl;
        return exit_usage;
    }

    try {
        return args.continuous_interval_.count() > 0 ? run_continuous(args) : run_single(args);
    } catch (ConfigurationError const& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        return exit_usage;
    }
}
