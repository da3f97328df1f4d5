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
#include <cstdint>

#include "SBTTypes.hpp"

using namespace serial_bt;

namespace serial_bt {

std::string to_string(const DriverGeneration v) noexcept {
    switch(v) {
        case DriverGeneration::SD_API_V2: return "v2";
        case DriverGeneration::SD_API_V3: return "v3";
    }
    return "Unknown DriverGeneration";
}

#define DISCOVERY_STATUS(X) \
        X(SUCCESS) \
        X(MISSING_INSTANCE_ID) \
        X(UNKNOWN_ADAPTER_VENDOR) \
        X(UNSUPPORTED_HARDWARE) \
        X(ADAPTER_CREATION_FAILED) \
        X(ENUMERATION_FAILURE) \
        X(NO_DRIVER)

#define DISCOVERY_STATUS_CASE_TO_STRING(V) case DiscoveryStatus::V: return #V;

std::string to_string(const DiscoveryStatus v) noexcept {
    switch(v) {
    DISCOVERY_STATUS(DISCOVERY_STATUS_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown DiscoveryStatus";
}

std::string to_string(const HostPlatform v) noexcept {
    switch(v) {
        case HostPlatform::LINUX: return "linux";
        case HostPlatform::MACOS: return "darwin";
        case HostPlatform::WINDOWS: return "win32";
        case HostPlatform::OTHER: return "other";
    }
    return "Unknown HostPlatform";
}

} // namespace serial_bt

std::string RawDeviceDescriptor::toString() const noexcept {
    return "RawDevice[serial '"+serialNumber+"', port '"+comName+"', manufacturer '"+manufacturer+
           "', vid '"+vendorId+"', pid '"+productId+"', pnp '"+pnpId+"']";
}

std::string DiscoveryError::toString() const noexcept {
    if( !isError() ) {
        return "DiscoveryError[none]";
    }
    return "DiscoveryError["+to_string(status)+", id '"+instanceId+"': "+message+"]";
}
