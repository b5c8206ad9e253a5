/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "capture_orchestrator.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
    if (argc != 5) {
        std::cout << "Usage: " << argv[0] << " <ip> <username> <password> <output.png>" << std::endl;
        return 0;
    }

    std::cout << "Connecting to " << argv[1] << "..." << std::endl;

    tapocam::CaptureOrchestrator camera({ argv[1], argv[2], argv[3] });
    auto result = camera.capture(argv[4], tapocam::OutputFormat::PNG, tapocam::CaptureMethod::Auto);

    std::cout << result.message_ << std::endl;
    return result.success_ ? 0 : 1;
}
