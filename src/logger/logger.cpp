// Copyright (c) 2026 Liam Mercier
//
// This file is part of Dahlia.
//
// Dahlia is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License Version 3.0
// as published by the Free Software Foundation.
//
// Dahlia is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
// or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License v3.0
// for more details.
//
// You should have received a copy of the GNU General Public License v3.0
// along with Dahlia. If not, see <https://www.gnu.org/licenses/gpl-3.0.txt>

#include "logger.h"

#include <iostream>

void Logger::init(LogLevel init_level)
{
    init(init_level, std::cerr);
}

void Logger::init(LogLevel init_level, std::ostream & sink)
{
    Logger & inst = instance();

    // A second init without shutdown would leak the old worker.
    if (inst.running_)
    {
        return;
    }

    inst.level_ = init_level;
    inst.sink_ = &sink;
    inst.running_ = true;

    inst.worker_ = std::jthread([&inst](){
        inst.worker_loop();
    });
}

void Logger::shutdown()
{
    auto & inst = instance();

    {
        // prevent more messages during shutdown since we wait on a cv here.
        std::lock_guard lock(inst.queue_mutex_);
        inst.running_ = false;
    }

    inst.cv_.notify_one();

    // Wait for the worker to write out whatever is still queued.
    if (inst.worker_.joinable())
    {
        inst.worker_.join();
    }
}

Logger::~Logger()
{
    if (running_)
    {
        shutdown();
    }
}

Logger & Logger::instance()
{
    static Logger instance;
    return instance;
}

// Already in the instance, no need to grab again.
void Logger::push_message(LogLevel level, std::string msg)
{
    {
        std::lock_guard lock(queue_mutex_);

        // Lost the race with shutdown.
        if (!running_)
        {
            return;
        }

        msg_queue_.emplace_back(LogEntry{level, std::move(msg)});
    }

    // Do work if waiting (wakes up thread).
    cv_.notify_one();
}

void Logger::worker_loop()
{
    // This thread runs the entire time, reserve our own messages queue
    // using some preallocation to prevent allocations during run.
    std::vector<LogEntry> processing_queue;
    processing_queue.reserve(PREALLOCATE_QUEUE_SIZE);

    while (true)
    {
        // Lock the queue and wait.
        {
            std::unique_lock lock(queue_mutex_);

            cv_.wait(lock, [this] {
                return !msg_queue_.empty() || !running_;
            });

            // When we wake up, swap the queues so we own all of the
            // messages that have been pushed so far.
            std::swap(msg_queue_, processing_queue);

            // Prevent doing work if we stopped and have no more messages.
            if (!running_ && processing_queue.empty())
            {
                return;
            }
        }

        // Drop the lock, process the messages now.
        for (const auto & entry : processing_queue)
        {
            if (entry.level < level_)
            {
                continue;
            }

            *sink_ << log_prefix[static_cast<size_t>(entry.level)]
                   << entry.msg
                   << "\n";
        }

        sink_->flush();

        // Clear and restart the loop (thread goes back to sleep).
        processing_queue.clear();
    }
}
