/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "av_handles.hpp"

namespace tapocam {

enum class StreamStatus {
    Connecting,
    Playing,
    Failed,
};

// Hands the most recent decoded frame and the session status from the live555
// event loop thread over to the reader. Frames are swapped, never copied: the
// producer gets back the buffer it should decode into next.
class FrameExchange {
public:
    explicit FrameExchange(VideoFramePtr&& spare)
        : push_counter_(0)
        , pop_counter_(0)
        , frame_(std::move(spare))
        , status_(StreamStatus::Connecting)
    {
    }

    VideoFramePtr push(VideoFramePtr&& frame)
    {
        {
            std::scoped_lock lock(mutex_);
            std::swap(frame, frame_);
            push_counter_ += 1;
        }
        condvar_.notify_all();
        return std::move(frame);
    }

    void set_playing()
    {
        {
            std::scoped_lock lock(mutex_);
            if (status_ == StreamStatus::Connecting) {
                status_ = StreamStatus::Playing;
            }
        }
        condvar_.notify_all();
    }

    // The first reported error is kept.
    void set_failed(std::string const& error)
    {
        {
            std::scoped_lock lock(mutex_);
            if (status_ == StreamStatus::Failed) {
                return;
            }
            status_ = StreamStatus::Failed;
            error_ = error.empty() ? "stream closed" : error;
        }
        condvar_.notify_all();
    }

    // Blocks until the session either plays or fails. Returns
    // StreamStatus::Connecting if neither happened within `timeout`.
    StreamStatus wait_started(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        condvar_.wait_for(lock, timeout, [this] { return status_ != StreamStatus::Connecting; });
        return status_;
    }

    // Takes the newest frame not seen yet, leaving `spare` in its place.
    // Returns nothing on timeout or when the stream has failed.
    std::optional<VideoFramePtr> try_pop(VideoFramePtr&& spare, std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        condvar_.wait_for(lock, timeout, [this] {
            return pop_counter_ != push_counter_ || status_ == StreamStatus::Failed;
        });
        if (pop_counter_ == push_counter_) {
            return {};
        }
        std::swap(spare, frame_);
        pop_counter_ = push_counter_;
        return std::move(spare);
    }

    std::optional<std::string> error() const
    {
        std::scoped_lock lock(mutex_);
        if (status_ == StreamStatus::Failed) {
            return error_;
        }
        return {};
    }

private:
    uint64_t push_counter_;
    uint64_t pop_counter_;
    VideoFramePtr frame_;
    StreamStatus status_;
    std::string error_;
    mutable std::mutex mutex_;
    std::condition_variable condvar_;
};

} // namespace tapocam
