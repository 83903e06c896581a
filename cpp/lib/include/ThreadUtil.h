/** \file   ThreadUtil.h
 *  \brief  Various classes and utility functions for multi-threaded programs.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <mutex>


/** \class  ThreadSafeCounter
 *  \brief  Implements a numeric counter that can safely be shared between threads.
 *  \note   Typical usage would be to create an instance of this class in some "main" thread and pass references into
 *          worker threads that call the increment operator as needed.
 */
template <typename NumericType> class ThreadSafeCounter {
    std::mutex mutex_;
    NumericType counter_;
public:
    explicit ThreadSafeCounter(const NumericType initial_value = 0): counter_(initial_value) { }
    ThreadSafeCounter(const ThreadSafeCounter &) = delete;
    ThreadSafeCounter &operator=(const ThreadSafeCounter &) = delete;

    NumericType operator++(int);
};


// \return The value before the increment.
template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator++(int) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const NumericType previous_value(counter_);
    ++counter_;

    return previous_value;
}

