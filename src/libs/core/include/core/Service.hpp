/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <cassert>
#include <memory>

namespace shelf::core
{
    // Process-wide slot for an interface implementation (logger, config)
    // The slot is owned by the Service object that filled it: once that
    // object goes out of scope, the slot is empty again
    template<typename Class>
    class Service
    {
    public:
        Service() = default;
        explicit Service(std::unique_ptr<Class> service)
            : _owner{ true }
        {
            assign(std::move(service));
        }

        ~Service()
        {
            if (_owner)
                _service.reset();
        }

        Service(const Service&) = delete;
        Service(Service&&) = delete;
        Service& operator=(const Service&) = delete;
        Service& operator=(Service&&) = delete;

        Class* operator->() const { return get(); }
        Class& operator*() const { return *get(); }

        static Class* get() { return _service.get(); }
        static bool exists() { return static_cast<bool>(_service); }

    private:
        template<typename SubClass>
        static void assign(std::unique_ptr<SubClass> service)
        {
            assert(!_service);
            _service = std::move(service);
        }

        bool _owner{};
        static inline std::unique_ptr<Class> _service;
    };
} // namespace shelf::core
