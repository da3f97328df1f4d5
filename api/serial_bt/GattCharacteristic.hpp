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

#ifndef SBT_GATT_CHARACTERISTIC_HPP_
#define SBT_GATT_CHARACTERISTIC_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/octets.hpp>
#include <jau/ordered_atomic.hpp>

namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    /**
     * Value record of a GATT characteristic as reported by an adapter's driver.
     * <p>
     * Each instance receives a process wide unique instance id `<serviceInstanceId>.<n>`,
     * `n` being a monotonic counter starting at 1.
     * </p>
     */
    class GattCharacteristic {
        public:
            /** BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1.1 Characteristic Properties */
            enum PropertyBitVal : uint8_t {
                NONE            = 0,
                Broadcast       = (1 << 0),
                Read            = (1 << 1),
                WriteNoAck      = (1 << 2),
                WriteWithAck    = (1 << 3),
                Notify          = (1 << 4),
                Indicate        = (1 << 5),
                AuthSignedWrite = (1 << 6),
                ExtProps        = (1 << 7)
            };

        private:
            static jau::sc_atomic_uint32 next_id;

            std::string instanceId;
            std::string serviceInstanceId;
            std::string uuid;
            std::string name;

        public:
            const PropertyBitVal properties;
            jau::POctets value;

            GattCharacteristic(const std::string& serviceInstanceId_, const std::string& uuid_,
                               const PropertyBitVal properties_, const jau::TROOctets& value_);

            /** Process wide unique id of this characteristic, `<serviceInstanceId>.<n>`. */
            const std::string& getInstanceId() const noexcept { return instanceId; }

            /** Instance id of the GATT service this characteristic belongs to. */
            const std::string& getServiceInstanceId() const noexcept { return serviceInstanceId; }

            const std::string& getUUID() const noexcept { return uuid; }

            /** Returns the assigned name, or the uuid if none has been assigned. */
            const std::string& getName() const noexcept { return name.size() > 0 ? name : uuid; }

            void setName(const std::string& name_) noexcept { name = name_; }

            bool hasProperties(const PropertyBitVal v) const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<GattCharacteristic> GattCharacteristicRef;

    constexpr uint8_t number(const GattCharacteristic::PropertyBitVal rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr GattCharacteristic::PropertyBitVal operator |(const GattCharacteristic::PropertyBitVal lhs, const GattCharacteristic::PropertyBitVal rhs) noexcept {
        return static_cast<GattCharacteristic::PropertyBitVal> ( number(lhs) | number(rhs) );
    }
    constexpr GattCharacteristic::PropertyBitVal operator &(const GattCharacteristic::PropertyBitVal lhs, const GattCharacteristic::PropertyBitVal rhs) noexcept {
        return static_cast<GattCharacteristic::PropertyBitVal> ( number(lhs) & number(rhs) );
    }
    std::string to_string(const GattCharacteristic::PropertyBitVal mask) noexcept;

    /**@}*/

} // namespace serial_bt

#endif /* SBT_GATT_CHARACTERISTIC_HPP_ */
