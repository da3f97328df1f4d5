/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2022 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef SBT_CONST_HPP_
#define SBT_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace serial_bt {

    using namespace jau::fractions_i64_literals;

    /**
     * Maximum time to wait for a thread shutdown.
     *
     * Used for the AdapterManager discovery service.
     */
    inline constexpr const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT_MS = 8_s;

    /**
     * Default interval in milliseconds between two periodic adapter discovery cycles.
     */
    inline constexpr const int32_t DISCOVERY_INTERVAL_MS = 2000;

    /**
     * Default maximum time in milliseconds to wait for a driver enumeration to complete.
     */
    inline constexpr const int32_t ENUMERATE_TIMEOUT_MS = 10000;

} // namespace serial_bt

#endif /* SBT_CONST_HPP_ */
