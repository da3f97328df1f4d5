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

#ifndef SBT_TYPES_HPP_
#define SBT_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * SBTTypes.hpp Module for DriverGeneration, DiscoveryStatus, RawDeviceDescriptor etc:
 *
 * - Driver generation tags of the native radio driver
 * - Status codes of the adapter discovery
 * - Platform reported device descriptor
 */
namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    class SBTException : public jau::RuntimeException {
        public:
        SBTException(std::string const m, const char* file, int line) noexcept
        : RuntimeException("SBTException", m, file, line) {}

        SBTException(const char *m, const char* file, int line) noexcept
        : RuntimeException("SBTException", m, file, line) {}
    };

    /**
     * Native radio driver generation backing a SerialAdapter.
     *
     * The generation is selected by the development kit hardware revision,
     * see AdapterClassifier::classify().
     */
    enum class DriverGeneration : uint8_t {
        /** SoftDevice API v2 driver, nRF51 based development kits. */
        SD_API_V2 = 0,
        /** SoftDevice API v3 driver, nRF52 based development kits. */
        SD_API_V3 = 1
    };
    constexpr uint8_t number(const DriverGeneration rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Number of DriverGeneration values, usable as array dimension. */
    inline constexpr const size_t DRIVER_GENERATION_COUNT = 2;

    /** Returns the short driver version tag, i.e. `v2` or `v3`. */
    std::string to_string(const DriverGeneration v) noexcept;

    /**
     * Status of a single adapter discovery step.
     *
     * - Per device, non fatal for the discovery cycle: MISSING_INSTANCE_ID, UNKNOWN_ADAPTER_VENDOR,
     *   UNSUPPORTED_HARDWARE and ADAPTER_CREATION_FAILED
     * - Per discovery cycle, aborting the cycle only: ENUMERATION_FAILURE and NO_DRIVER
     */
    enum class DiscoveryStatus : uint8_t {
        SUCCESS                 = 0x00,
        /** Device reports neither a serial number nor a port name. */
        MISSING_INSTANCE_ID     = 0x01,
        /** Device instance id does not match the known vendor serial number pattern. */
        UNKNOWN_ADAPTER_VENDOR  = 0x02,
        /** Device development kit revision is not supported by any driver generation. */
        UNSUPPORTED_HARDWARE    = 0x03,
        /** Driver backend failed to create the adapter object. */
        ADAPTER_CREATION_FAILED = 0x04,
        /** Driver enumeration reported an error or timed out. */
        ENUMERATION_FAILURE     = 0x10,
        /** No driver backend registered for the required generation. */
        NO_DRIVER               = 0x11
    };
    constexpr uint8_t number(const DiscoveryStatus rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const DiscoveryStatus v) noexcept;

    /** Returns true if the given status only affects a single device and not the discovery cycle. */
    constexpr bool isDeviceStatus(const DiscoveryStatus v) noexcept {
        return DiscoveryStatus::SUCCESS != v && number(v) < number(DiscoveryStatus::ENUMERATION_FAILURE);
    }

    /**
     * Host operating system, used to select platform advisory messages.
     */
    enum class HostPlatform : uint8_t {
        LINUX   = 0,
        MACOS   = 1,
        WINDOWS = 2,
        OTHER   = 3
    };
    std::string to_string(const HostPlatform v) noexcept;

    /** Returns the HostPlatform this library has been built for. */
    constexpr HostPlatform currentHostPlatform() noexcept {
#if defined(__APPLE__)
        return HostPlatform::MACOS;
#elif defined(_WIN32)
        return HostPlatform::WINDOWS;
#elif defined(__linux__)
        return HostPlatform::LINUX;
#else
        return HostPlatform::OTHER;
#endif
    }

    /**
     * Device descriptor as reported by the driver enumeration.
     *
     * An empty string denotes an absent field.
     */
    struct RawDeviceDescriptor {
        std::string serialNumber;
        /** Port or communication name, e.g. `/dev/ttyACM0` or `COM3`. */
        std::string comName;
        std::string manufacturer;
        std::string vendorId;
        std::string productId;
        std::string pnpId;

        RawDeviceDescriptor() noexcept = default;

        RawDeviceDescriptor(std::string serialNumber_, std::string comName_, std::string manufacturer_) noexcept
        : serialNumber(std::move(serialNumber_)), comName(std::move(comName_)), manufacturer(std::move(manufacturer_)) {}

        std::string toString() const noexcept;
    };

    /**
     * Discovery error value, passed to AdapterManagerListener::discoveryError()
     * and to the on-demand discovery callback.
     *
     * Status DiscoveryStatus::SUCCESS denotes no error.
     */
    struct DiscoveryError {
        DiscoveryStatus status;
        /** Affected device instance id or port, may be empty. */
        std::string instanceId;
        std::string message;

        DiscoveryError() noexcept
        : status(DiscoveryStatus::SUCCESS), instanceId(), message() {}

        DiscoveryError(const DiscoveryStatus status_, std::string instanceId_, std::string message_) noexcept
        : status(status_), instanceId(std::move(instanceId_)), message(std::move(message_)) {}

        bool isError() const noexcept { return DiscoveryStatus::SUCCESS != status; }

        std::string toString() const noexcept;
    };

    /**@}*/

} // namespace serial_bt

#endif /* SBT_TYPES_HPP_ */
