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

#ifndef SBT_DRIVER_BACKEND_HPP_
#define SBT_DRIVER_BACKEND_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <array>
#include <mutex>

#include <jau/darray.hpp>
#include <jau/functional.hpp>

#include "SBTTypes.hpp"

namespace serial_bt {

    /** @defgroup SBTDriverAPI Serial-BT Driver Plugin API
     *  Interfaces a native radio driver generation has to implement
     *  to be used by the AdapterManager.
     *
     *  @{
     */

    /**
     * Opaque native driver adapter object of one driver generation,
     * wrapped by exactly one SerialAdapter.
     */
    class DriverAdapter {
        public:
            virtual ~DriverAdapter() noexcept = default;

            virtual DriverGeneration getGeneration() const noexcept = 0;

            /**
             * Opens the native driver session on the given port.
             * @param comName port or communication name of the physical device
             * @return true if the session has been opened, otherwise false
             */
            virtual bool open(const std::string& comName) noexcept = 0;

            /** Closes the native driver session, if opened. */
            virtual void close() noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };

    /**
     * Completion callback of DriverBackend::enumerate().
     *
     * @param error DiscoveryStatus::SUCCESS on success, otherwise the enumeration failure
     * @param devices the enumerated devices, empty on failure
     */
    typedef jau::function<void(const DiscoveryError&, const jau::darray<RawDeviceDescriptor>&)> EnumerateCallback;

    /**
     * Capability set of one native radio driver generation.
     */
    class DriverBackend {
        public:
            virtual ~DriverBackend() noexcept = default;

            virtual DriverGeneration getGeneration() const noexcept = 0;

            /**
             * Asynchronous enumeration of all attached devices.
             * <p>
             * Implementation shall not block and shall invoke the given callback exactly once,
             * either from within this call or from any other thread.
             * </p>
             */
            virtual void enumerate(const EnumerateCallback& cb) noexcept = 0;

            /**
             * Synchronous construction of a driver adapter object of this generation.
             * @return the new adapter object or nullptr on failure
             */
            virtual std::unique_ptr<DriverAdapter> createAdapter() = 0;

            virtual std::string toString() const noexcept {
                return "DriverBackend["+to_string(getGeneration())+"]";
            }
    };
    typedef std::shared_ptr<DriverBackend> DriverBackendRef;

    /**
     * Mapping DriverGeneration to its DriverBackend.
     *
     * The set of generations is closed, backends are stored by DriverGeneration index.
     * <p>
     * Enumeration of attached devices is performed by one backend only,
     * by default DriverGeneration::SD_API_V2.
     * </p>
     */
    class DriverRegistry {
        public:
            typedef jau::nsize_t size_type;

        private:
            mutable std::mutex mtx_backends;
            std::array<DriverBackendRef, DRIVER_GENERATION_COUNT> backends;
            DriverGeneration enumeratorGeneration;

        public:
            DriverRegistry() noexcept;

            DriverRegistry(const DriverRegistry&) = delete;
            void operator=(const DriverRegistry&) = delete;

            /**
             * Returns the process wide default registry,
             * used by AdapterManager::get().
             * <p>
             * Driver plugins shall register their backends before the first AdapterManager::get() call.
             * </p>
             */
            static DriverRegistry& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static DriverRegistry r;
                return r;
            }

            /**
             * Registers the given backend for its DriverBackend::getGeneration(),
             * replacing a previously registered one.
             * @throws jau::IllegalArgumentException if backend is nullptr
             */
            void registerBackend(const DriverBackendRef& backend);

            /**
             * Removes the backend of the given generation.
             * @return the removed backend or nullptr if none was registered
             */
            DriverBackendRef removeBackend(const DriverGeneration gen) noexcept;

            /** Returns the backend of the given generation or nullptr if none is registered. */
            DriverBackendRef getBackend(const DriverGeneration gen) const noexcept;

            /** Returns the backend used for device enumeration or nullptr if none is registered. */
            DriverBackendRef getEnumerator() const noexcept { return getBackend(getEnumeratorGeneration()); }

            DriverGeneration getEnumeratorGeneration() const noexcept;
            void setEnumeratorGeneration(const DriverGeneration gen) noexcept;

            size_type getBackendCount() const noexcept;

            /** Removes all registered backends. */
            void clear() noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace serial_bt

#endif /* SBT_DRIVER_BACKEND_HPP_ */
