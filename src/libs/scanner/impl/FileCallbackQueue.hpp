/*
 * Copyright (C) 2026 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>

#include <boost/asio/io_context.hpp>

#include "core/IOContextRunner.hpp"

namespace shelf::scanner
{
    // Runs a callback on each pushed file using a pool of threads
    // Exceptions thrown by the callback are logged and counted
    class FileCallbackQueue
    {
    public:
        using FileCallback = std::function<void(const std::filesystem::path& file)>;

        FileCallbackQueue(std::size_t threadCount, FileCallback callback);
        ~FileCallbackQueue();
        FileCallbackQueue(const FileCallbackQueue&) = delete;
        FileCallbackQueue& operator=(const FileCallbackQueue&) = delete;

        void push(const std::filesystem::path& file);

        std::size_t getFailureCount() const { return _failureCount; }

        void wait(std::size_t maxOngoingCount = 0); // wait until ongoing callback count <= maxOngoingCount

    private:
        boost::asio::io_context _ioContext;
        core::IOContextRunner _contextRunner;
        const FileCallback _callback;

        std::mutex _mutex;
        std::condition_variable _condVar;
        std::size_t _ongoingCount{};
        std::atomic<std::size_t> _failureCount{};
    };
} // namespace shelf::scanner
