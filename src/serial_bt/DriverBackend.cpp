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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "DriverBackend.hpp"

using namespace serial_bt;

DriverRegistry::DriverRegistry() noexcept
: backends(), enumeratorGeneration(DriverGeneration::SD_API_V2)
{ }

void DriverRegistry::registerBackend(const DriverBackendRef& backend) {
    if( nullptr == backend ) {
        throw jau::IllegalArgumentException("DriverBackend ref is null", E_FILE_LINE);
    }
    const DriverGeneration gen = backend->getGeneration();
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    DriverBackendRef& slot = backends[number(gen)];
    if( nullptr != slot ) {
        WARN_PRINT("DriverRegistry::registerBackend: Replacing %s with %s", slot->toString().c_str(), backend->toString().c_str());
    } else {
        DBG_PRINT("DriverRegistry::registerBackend: %s", backend->toString().c_str());
    }
    slot = backend;
}

DriverBackendRef DriverRegistry::removeBackend(const DriverGeneration gen) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    DriverBackendRef res = backends[number(gen)];
    backends[number(gen)] = nullptr;
    return res;
}

DriverBackendRef DriverRegistry::getBackend(const DriverGeneration gen) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    return backends[number(gen)];
}

DriverGeneration DriverRegistry::getEnumeratorGeneration() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    return enumeratorGeneration;
}

void DriverRegistry::setEnumeratorGeneration(const DriverGeneration gen) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    enumeratorGeneration = gen;
}

DriverRegistry::size_type DriverRegistry::getBackendCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    size_type count = 0;
    for(const DriverBackendRef& b : backends) {
        if( nullptr != b ) {
            ++count;
        }
    }
    return count;
}

void DriverRegistry::clear() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    for(DriverBackendRef& b : backends) {
        b = nullptr;
    }
}

std::string DriverRegistry::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_backends); // RAII-style acquire and relinquish via destructor
    std::string res("DriverRegistry[enumerator "+to_string(enumeratorGeneration)+", backends [");
    bool comma = false;
    for(const DriverBackendRef& b : backends) {
        if( nullptr != b ) {
            if( comma ) {
                res.append(", ");
            }
            res.append(b->toString());
            comma = true;
        }
    }
    res.append("]]");
    return res;
}
