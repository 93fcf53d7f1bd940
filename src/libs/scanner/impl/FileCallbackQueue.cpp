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

#include "FileCallbackQueue.hpp"

#include <boost/asio/post.hpp>

#include "core/ILogger.hpp"

namespace shelf::scanner
{
    FileCallbackQueue::FileCallbackQueue(std::size_t threadCount, FileCallback callback)
        : _contextRunner{ _ioContext, threadCount, "FileCallback" }
        , _callback{ std::move(callback) }
    {
    }

    FileCallbackQueue::~FileCallbackQueue()
    {
        wait();
    }

    void FileCallbackQueue::push(const std::filesystem::path& file)
    {
        {
            std::scoped_lock lock{ _mutex };
            _ongoingCount += 1;
        }

        boost::asio::post(_ioContext, [this, file] {
            try
            {
                _callback(file);
            }
            catch (const std::exception& e)
            {
                SHELF_LOG(SCANNER, ERROR, "Error while processing file '" << file.string() << "': " << e.what());
                _failureCount += 1;
            }
            catch (...)
            {
                SHELF_LOG(SCANNER, ERROR, "Unknown error while processing file '" << file.string() << "'");
                _failureCount += 1;
            }

            std::scoped_lock lock{ _mutex };
            _ongoingCount -= 1;
            _condVar.notify_all();
        });
    }

    void FileCallbackQueue::wait(std::size_t maxOngoingCount)
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [=, this] { return _ongoingCount <= maxOngoingCount; });
    }
} // namespace shelf::scanner
