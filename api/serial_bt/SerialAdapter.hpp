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

#ifndef SBT_SERIAL_ADAPTER_HPP_
#define SBT_SERIAL_ADAPTER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <atomic>

#include <jau/cow_darray.hpp>
#include <jau/ordered_atomic.hpp>

#include "SBTTypes.hpp"
#include "DriverBackend.hpp"

namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    class SerialAdapter; // forward
    typedef std::shared_ptr<SerialAdapter> SerialAdapterRef;

    class AdapterRegistry; // forward

    /**
     * SerialAdapter session state listener for opened and closed events.
     * <p>
     * A listener instance may be attached to a SerialAdapter via
     * SerialAdapter::addStateListener().
     * </p>
     * <p>
     * Callbacks are performed on the thread calling SerialAdapter::open() or SerialAdapter::close().
     * </p>
     */
    class AdapterStateListener {
        public:
            /**
             * SerialAdapter session has been opened.
             * @param adapter the opened adapter
             */
            virtual void adapterOpened(const SerialAdapterRef& adapter) {
                (void)adapter;
            }

            /**
             * SerialAdapter session has been closed.
             * @param adapter the closed adapter
             */
            virtual void adapterClosed(const SerialAdapterRef& adapter) {
                (void)adapter;
            }

            virtual ~AdapterStateListener() noexcept = default;

            virtual std::string toString() const noexcept {
                return "AdapterStateListener[this "+jau::to_hexstring(this)+"]";
            }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const AdapterStateListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const AdapterStateListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<AdapterStateListener> AdapterStateListenerRef;

    /**
     * Logical adapter, representing one physical device bound to one DriverGeneration.
     * <p>
     * Instances are created by the AdapterRegistry only,
     * exactly one instance exists per device instance id at any time.
     * All identity properties are immutable, only the session state
     * changes via open() and close().
     * </p>
     */
    class SerialAdapter : public std::enable_shared_from_this<SerialAdapter> {
        public:
            typedef jau::nsize_t size_type;

        private:
            friend AdapterRegistry;

            /** Private class only for private make_shared(). */
            class ctor_cookie { friend SerialAdapter; ctor_cookie(const uint16_t secret) { (void)secret; } };

            /** Private std::make_shared<SerialAdapter>(..) vehicle for friends. */
            static SerialAdapterRef make_shared(const std::string& instanceId, const DriverGeneration generation,
                                                std::unique_ptr<DriverAdapter> driverAdapter,
                                                const RawDeviceDescriptor& d, const std::string& notSupportedMessage) {
                return std::make_shared<SerialAdapter>(SerialAdapter::ctor_cookie(0), instanceId, generation,
                                                       std::move(driverAdapter), d, notSupportedMessage);
            }

            typedef jau::cow_darray<AdapterStateListenerRef, size_type> stateListenerList_t;
            static stateListenerList_t::equal_comparator stateListenerRefEqComparator;

            const std::string instanceId;
            const DriverGeneration generation;
            const std::string comName;
            const std::string serialNumber;
            const std::string manufacturer;
            const std::string notSupportedMessage;
            const uint64_t ts_creation;

            std::unique_ptr<DriverAdapter> driverAdapter;

            std::recursive_mutex mtx_session; // for open() and close()
            jau::sc_atomic_bool is_open;

            stateListenerList_t stateListenerList;

            void sendAdapterOpened() noexcept;
            void sendAdapterClosed() noexcept;

        public:
            /** Private ctor for private SerialAdapter::make_shared() intended for friends. */
            SerialAdapter(const SerialAdapter::ctor_cookie& cc,
                          std::string instanceId_, const DriverGeneration generation_,
                          std::unique_ptr<DriverAdapter> driverAdapter_,
                          const RawDeviceDescriptor& d, std::string notSupportedMessage_) noexcept;

            SerialAdapter(const SerialAdapter&) = delete;
            void operator=(const SerialAdapter&) = delete;

            /**
             * Releases the driver adapter object, closing its session if still open
             * without notifying any listener.
             */
            ~SerialAdapter() noexcept;

            /** Returns the stable device instance id, i.e. serial number or port name. */
            const std::string& getInstanceId() const noexcept { return instanceId; }

            DriverGeneration getDriverGeneration() const noexcept { return generation; }

            /** Returns the port or communication name, may be empty. */
            const std::string& getComName() const noexcept { return comName; }

            /** Returns the serial number, may be empty. */
            const std::string& getSerialNumber() const noexcept { return serialNumber; }

            const std::string& getManufacturer() const noexcept { return manufacturer; }

            /**
             * Returns the informal platform advisory message, empty if none applies.
             * @see AdapterClassifier::getPlatformAdvisory()
             */
            const std::string& getNotSupportedMessage() const noexcept { return notSupportedMessage; }

            bool hasNotSupportedMessage() const noexcept { return notSupportedMessage.length() > 0; }

            /** Returns the creation timestamp in monotonic milliseconds. */
            uint64_t getCreationTimestamp() const noexcept { return ts_creation; }

            /** Returns the opaque driver adapter object, owned by this instance. */
            DriverAdapter& getDriverAdapter() noexcept { return *driverAdapter; }

            bool isOpen() const noexcept { return is_open; }

            /**
             * Opens the driver session on getComName().
             * <p>
             * Notifies all AdapterStateListener via AdapterStateListener::adapterOpened() if newly opened.
             * </p>
             * @return true if newly opened or already open, otherwise false
             */
            bool open() noexcept;

            /**
             * Closes the driver session.
             * <p>
             * Notifies all AdapterStateListener via AdapterStateListener::adapterClosed() if it was open.
             * </p>
             * @return true if it was open and is now closed, otherwise false
             */
            bool close() noexcept;

            /**
             * Adds the given listener, if not yet contained.
             * @return true if newly added, otherwise false
             */
            bool addStateListener(const AdapterStateListenerRef& l) noexcept;

            /**
             * Removes the given listener.
             * @return true if removed, otherwise false
             */
            bool removeStateListener(const AdapterStateListenerRef& l) noexcept;

            /**
             * Removes all listener.
             * @return the number of removed listener
             */
            size_type removeAllStateListener() noexcept;

            size_type getStateListenerCount() const noexcept { return stateListenerList.size(); }

            std::string toString() const noexcept;
    };

    inline bool operator==(const SerialAdapter& lhs, const SerialAdapter& rhs) noexcept
    { return lhs.getInstanceId() == rhs.getInstanceId(); }

    inline bool operator!=(const SerialAdapter& lhs, const SerialAdapter& rhs) noexcept
    { return !(lhs == rhs); }

    /**@}*/

} // namespace serial_bt

#endif /* SBT_SERIAL_ADAPTER_HPP_ */
