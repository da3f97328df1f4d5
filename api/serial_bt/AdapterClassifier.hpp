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

#ifndef SBT_ADAPTER_CLASSIFIER_HPP_
#define SBT_ADAPTER_CLASSIFIER_HPP_

#include <string>
#include <cstdint>

#include "SBTTypes.hpp"

namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    /**
     * Pure classification of enumerated devices to their DriverGeneration.
     * <p>
     * Classification uses fixed rule tables only, no I/O and no mutable state.
     * </p>
     * <p>
     * Segger J-Link serial numbers of Nordic development kits end with `68`,
     * followed by one development kit revision digit and six arbitrary digits, e.g. `680123456`.
     * The revision digit selects the driver generation:
     * - 0, 1: DriverGeneration::SD_API_V2
     * - 2, 3: DriverGeneration::SD_API_V3
     * - any other: DiscoveryStatus::UNSUPPORTED_HARDWARE
     * </p>
     */
    namespace AdapterClassifier {

        struct ClassificationResult {
            DiscoveryStatus status;
            /** Device instance id, empty if status is DiscoveryStatus::MISSING_INSTANCE_ID */
            std::string instanceId;
            /** Resolved driver generation, only valid if status is DiscoveryStatus::SUCCESS */
            DriverGeneration generation;

            bool isSuccess() const noexcept { return DiscoveryStatus::SUCCESS == status; }

            std::string toString() const noexcept;
        };

        /**
         * Computes the stable device instance id,
         * i.e. the serial number if present, otherwise the port name.
         *
         * @param d the enumerated device
         * @param instanceId reference to store the instance id
         * @return DiscoveryStatus::SUCCESS or DiscoveryStatus::MISSING_INSTANCE_ID
         */
        DiscoveryStatus getInstanceId(const RawDeviceDescriptor& d, std::string& instanceId) noexcept;

        /**
         * Matches the Segger serial number pattern.
         *
         * @param instanceId the device instance id
         * @param revision reference to store the development kit revision digit value on success
         * @return true if matching, otherwise false
         */
        bool matchSeggerSerialNumber(const std::string& instanceId, int& revision) noexcept;

        /**
         * Maps the development kit revision to its DriverGeneration.
         *
         * @param revision development kit revision digit value
         * @param generation reference to store the driver generation on success
         * @return DiscoveryStatus::SUCCESS or DiscoveryStatus::UNSUPPORTED_HARDWARE
         */
        DiscoveryStatus toDriverGeneration(const int revision, DriverGeneration& generation) noexcept;

        /**
         * Classifies the given device, see AdapterClassifier.
         */
        ClassificationResult classify(const RawDeviceDescriptor& d) noexcept;

        /**
         * Returns the informal advisory message for devices of the given manufacturer on the given platform,
         * or an empty string if none applies.
         */
        std::string getPlatformAdvisory(const HostPlatform platform, const std::string& manufacturer) noexcept;

        /**
         * Returns the informal advisory message for devices of the given manufacturer on the current platform,
         * or an empty string if none applies.
         */
        inline std::string getPlatformAdvisory(const std::string& manufacturer) noexcept {
            return getPlatformAdvisory(currentHostPlatform(), manufacturer);
        }
    }

    /**@}*/

} // namespace serial_bt

#endif /* SBT_ADAPTER_CLASSIFIER_HPP_ */
