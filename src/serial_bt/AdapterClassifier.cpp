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

#include "AdapterClassifier.hpp"

using namespace serial_bt;

namespace serial_bt::AdapterClassifier {

    /** Segger serial number suffix: '68' + revision digit + 6 digits */
    static constexpr const char SEGGER_SERIAL_TAG[] = "68";
    static constexpr const size_t SEGGER_SERIAL_TAIL_DIGITS = 6;
    static constexpr const size_t SEGGER_SERIAL_SUFFIX_LEN = 2 + 1 + SEGGER_SERIAL_TAIL_DIGITS;

    struct RevisionRule {
        int revision;
        DriverGeneration generation;
    };

    static constexpr const RevisionRule revisionRules[] = {
        { 0, DriverGeneration::SD_API_V2 },
        { 1, DriverGeneration::SD_API_V2 },
        { 2, DriverGeneration::SD_API_V3 },
        { 3, DriverGeneration::SD_API_V3 }
    };

    struct PlatformAdvisory {
        HostPlatform platform;
        const char* manufacturer;
        const char* message;
    };

    static constexpr const PlatformAdvisory platformAdvisories[] = {
        { HostPlatform::MACOS, "MBED",
          "This adapter with mbed CMSIS firmware is currently not supported on OS X. "
          "Please visit www.nordicsemi.com/nRFConnectOSXfix for further instructions." },
        { HostPlatform::MACOS, "SEGGER",
          "Note: Adapters with Segger JLink debug probe requires MSD to be disabled to function properly on OSX. "
          "Please visit www.nordicsemi.com/nRFConnectOSXfix for further instructions." }
    };

    static bool isDigit(const char c) noexcept {
        return '0' <= c && c <= '9';
    }

    std::string ClassificationResult::toString() const noexcept {
        std::string res = "Classification["+to_string(status)+", id '"+instanceId+"'";
        if( isSuccess() ) {
            res.append(", driver "+to_string(generation));
        }
        res.append("]");
        return res;
    }

    DiscoveryStatus getInstanceId(const RawDeviceDescriptor& d, std::string& instanceId) noexcept {
        if( d.serialNumber.length() > 0 ) {
            instanceId = d.serialNumber;
            return DiscoveryStatus::SUCCESS;
        }
        if( d.comName.length() > 0 ) {
            instanceId = d.comName;
            return DiscoveryStatus::SUCCESS;
        }
        instanceId.clear();
        return DiscoveryStatus::MISSING_INSTANCE_ID;
    }

    bool matchSeggerSerialNumber(const std::string& instanceId, int& revision) noexcept {
        const size_t len = instanceId.length();
        if( len < SEGGER_SERIAL_SUFFIX_LEN ) {
            return false;
        }
        const size_t pos = len - SEGGER_SERIAL_SUFFIX_LEN;
        if( 0 != instanceId.compare(pos, 2, SEGGER_SERIAL_TAG) ) {
            return false;
        }
        const char rev = instanceId[pos+2];
        if( !isDigit(rev) ) {
            return false;
        }
        for(size_t i = pos+3; i < len; ++i) {
            if( !isDigit(instanceId[i]) ) {
                return false;
            }
        }
        revision = rev - '0';
        return true;
    }

    DiscoveryStatus toDriverGeneration(const int revision, DriverGeneration& generation) noexcept {
        for(const RevisionRule& r : revisionRules) {
            if( r.revision == revision ) {
                generation = r.generation;
                return DiscoveryStatus::SUCCESS;
            }
        }
        return DiscoveryStatus::UNSUPPORTED_HARDWARE;
    }

    ClassificationResult classify(const RawDeviceDescriptor& d) noexcept {
        ClassificationResult res { DiscoveryStatus::SUCCESS, std::string(), DriverGeneration::SD_API_V2 };

        res.status = getInstanceId(d, res.instanceId);
        if( DiscoveryStatus::SUCCESS != res.status ) {
            return res;
        }
        int revision = -1;
        if( !matchSeggerSerialNumber(res.instanceId, revision) ) {
            res.status = DiscoveryStatus::UNKNOWN_ADAPTER_VENDOR;
            return res;
        }
        res.status = toDriverGeneration(revision, res.generation);
        return res;
    }

    std::string getPlatformAdvisory(const HostPlatform platform, const std::string& manufacturer) noexcept {
        for(const PlatformAdvisory& a : platformAdvisories) {
            if( a.platform == platform && manufacturer == a.manufacturer ) {
                return std::string(a.message);
            }
        }
        return std::string();
    }

} // namespace serial_bt::AdapterClassifier
