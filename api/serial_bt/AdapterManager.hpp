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

#ifndef SBT_ADAPTER_MANAGER_HPP_
#define SBT_ADAPTER_MANAGER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <atomic>
#include <condition_variable>

#include <jau/environment.hpp>
#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/service_runner.hpp>

#include "SBTConst.hpp"
#include "SBTTypes.hpp"
#include "DriverBackend.hpp"
#include "SerialAdapter.hpp"
#include "LifecycleBroadcaster.hpp"
#include "AdapterRegistry.hpp"

namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    class AdapterManager; // forward

    /**
     * Adapter discovery singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class DiscoveryEnv : public jau::root_environment {
        friend class AdapterManager;

        private:
            DiscoveryEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers environment initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Interval between two periodic discovery cycles in milliseconds, defaults to 2000ms.
             * <p>
             * Environment variable is 'serial_bt.discovery.interval'.
             * </p>
             */
            const int32_t DISCOVERY_INTERVAL;

            /**
             * Timeout for a driver enumeration to complete in milliseconds, defaults to 10s.
             * <p>
             * Environment variable is 'serial_bt.discovery.enumerate.timeout'.
             * </p>
             */
            const int32_t ENUMERATE_TIMEOUT;

            /**
             * Debug all discovery events
             * <p>
             * Environment variable is 'serial_bt.debug.discovery.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static DiscoveryEnv& get() noexcept {
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
                static DiscoveryEnv e;
                return e;
            }
    };

    /**
     * AdapterManager listener for the adapter set and adapter session events.
     * <p>
     * adapterAdded(), adapterRemoved() and discoveryError() are performed on the
     * dedicated discovery thread, adapterOpened() and adapterClosed()
     * on the thread calling SerialAdapter::open() or SerialAdapter::close().
     * </p>
     * <p>
     * User implementations shall return as early as possible to avoid blocking the discovery thread.
     * </p>
     * <p>
     * adapterOpened() and adapterClosed() are delivered while holding the adapter's forwarding lock,
     * which the discovery thread acquires when removing that adapter.
     * Hence they shall not wait for a discovery cycle, e.g. via AdapterManager::getAdapters(),
     * nor call AdapterManager::addListener() or AdapterManager::close().
     * </p>
     * <p>
     * Events of one discovery cycle are delivered to the listener set at the start of the cycle's event dispatch.
     * A listener added during dispatch receives the cycle's result via the AdapterManager::addListener() replay only.
     * </p>
     */
    class AdapterManagerListener {
        public:
            /**
             * A newly attached adapter has been discovered.
             * @param adapter the added adapter
             */
            virtual void adapterAdded(const SerialAdapterRef& adapter) {
                (void)adapter;
            }

            /**
             * A previously discovered adapter is no longer attached.
             * <p>
             * The removed adapter no longer issues adapterOpened() or adapterClosed().
             * </p>
             * @param adapter the removed adapter
             */
            virtual void adapterRemoved(const SerialAdapterRef& adapter) {
                (void)adapter;
            }

            /**
             * A managed adapter's session has been opened, see SerialAdapter::open().
             */
            virtual void adapterOpened(const SerialAdapterRef& adapter) {
                (void)adapter;
            }

            /**
             * A managed adapter's session has been closed, see SerialAdapter::close().
             */
            virtual void adapterClosed(const SerialAdapterRef& adapter) {
                (void)adapter;
            }

            /**
             * A discovery error occurred, either for a single device or for the whole discovery cycle.
             * @see isDeviceStatus()
             */
            virtual void discoveryError(const DiscoveryError& error) {
                (void)error;
            }

            virtual ~AdapterManagerListener() noexcept = default;

            virtual std::string toString() const noexcept {
                return "AdapterManagerListener[this "+jau::to_hexstring(this)+"]";
            }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const AdapterManagerListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const AdapterManagerListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<AdapterManagerListener> AdapterManagerListenerRef;

    /**
     * Completion callback of AdapterManager::getAdapters().
     *
     * @param error DiscoveryError without error on success, otherwise the discovery cycle failure
     * @param adapters snapshot of all live adapters on success, empty on failure
     */
    typedef jau::function<void(const DiscoveryError&, const AdapterMap&)> AdaptersCallback;

    /**
     * Discovery cycle state.
     */
    enum class DiscoveryState : uint8_t {
        /** Waiting for the next periodic or on-demand cycle. */
        IDLE        = 0,
        /** Enumerating and reconciling. */
        RECONCILING = 1
    };
    std::string to_string(const DiscoveryState v) noexcept;

    /**
     * A thread safe singleton adapter discovery and lifecycle manager.
     * <p>
     * A dedicated discovery thread periodically enumerates all attached devices via
     * the DriverRegistry::getEnumerator() backend, reconciles the AdapterRegistry and
     * notifies all AdapterManagerListener about added and removed adapter.
     * The discovery thread is the only instance mutating the AdapterRegistry,
     * on-demand requests via getAdapters() or triggerDiscovery() issued while a
     * cycle is in progress collapse into one trailing cycle.
     * </p>
     * <p>
     * A failed enumeration aborts the current cycle without mutating the registry,
     * the next periodic cycle runs as usual.
     * </p>
     *
     * Controlling Environment variables, see {@link DiscoveryEnv}.
     */
    class AdapterManager : public std::enable_shared_from_this<AdapterManager> {
        public:
            typedef jau::nsize_t size_type;

        private:
            /** Forwarding sink of the LifecycleBroadcaster */
            class StateSink : public AdapterStateListener {
                private:
                    AdapterManager& mngr;
                public:
                    explicit StateSink(AdapterManager& mngr_) noexcept : mngr(mngr_) {}
                    void adapterOpened(const SerialAdapterRef& adapter) override;
                    void adapterClosed(const SerialAdapterRef& adapter) override;
                    std::string toString() const noexcept override { return "AdapterManager::StateSink"; }
            };

            /** Private class only for private make_shared(). */
            class ctor_cookie { friend AdapterManager; ctor_cookie(const uint16_t secret) { (void)secret; } };

            typedef jau::cow_darray<AdapterManagerListenerRef, size_type> listenerList_t;
            static listenerList_t::equal_comparator listenerRefEqComparator;

            static std::mutex mtx_singleton;
            static jau::sc_atomic_bool instance_created;

            const DiscoveryEnv & env;
            DriverRegistry& drivers;

            StateSink stateSink;
            LifecycleBroadcaster broadcaster;
            AdapterRegistry registry;

            listenerList_t listenerList;
            /** Serializes a discovery cycle's reconcile and event dispatch with the addListener() replay. */
            std::recursive_mutex mtx_membership;

            std::mutex mtx_discovery;
            std::condition_variable cv_discovery;
            bool discoveryRequested;
            jau::darray<AdaptersCallback> pendingCallbacks;
            jau::sc_atomic_bool reconciling;

            std::mutex mtx_enumerate;
            std::condition_variable cv_enumerate;
            uint64_t enumerateCycle;
            bool enumerateCompleted;
            DiscoveryError enumerateError;
            jau::darray<RawDeviceDescriptor> enumerateDevices;

            jau::service_runner discovery_service;

            static std::shared_ptr<AdapterManager> make_shared() {
                std::shared_ptr<AdapterManager> m = std::make_shared<AdapterManager>(AdapterManager::ctor_cookie(0), DriverRegistry::get());
                m->start();
                return m;
            }

            void start() noexcept;

            void discoveryWork(jau::service_runner& sr) noexcept;
            void discoveryEndLocked(jau::service_runner& sr) noexcept;

            void runDiscoveryCycle(jau::darray<AdaptersCallback>& callbacks) noexcept;

            /**
             * Enumerates all devices via the DriverRegistry::getEnumerator() backend,
             * blocking until completion, timeout or shutdown.
             */
            DiscoveryError enumerate(jau::darray<RawDeviceDescriptor>& devices) noexcept;
            void enumerateDone(const uint64_t cycle, const DiscoveryError& error, const jau::darray<RawDeviceDescriptor>& devices) noexcept;

            void invokeCallbacks(jau::darray<AdaptersCallback>& callbacks, const DiscoveryError& error, const AdapterMap& adapters) noexcept;

            void sendAdapterAdded(const listenerList_t::storage_t& listeners, const SerialAdapterRef& adapter) noexcept;
            void sendAdapterRemoved(const listenerList_t::storage_t& listeners, const SerialAdapterRef& adapter) noexcept;
            void sendAdapterOpened(const SerialAdapterRef& adapter) noexcept;
            void sendAdapterClosed(const SerialAdapterRef& adapter) noexcept;
            void sendDiscoveryError(const listenerList_t::storage_t& listeners, const DiscoveryError& error) noexcept;

        public:
            /**
             * Private ctor for private AdapterManager::make_shared() intended for get() only.
             * @throws jau::IllegalStateException if an instance has been constructed already
             */
            AdapterManager(const AdapterManager::ctor_cookie& cc, DriverRegistry& drivers_);

            AdapterManager(const AdapterManager&) = delete;
            void operator=(const AdapterManager&) = delete;

            /**
             * Retrieves the singleton instance.
             * <p>
             * First call creates the instance using DriverRegistry::get()
             * and starts the periodic discovery.
             * </p>
             * @return singleton instance.
             */
            static const std::shared_ptr<AdapterManager>& get() {
                const std::lock_guard<std::mutex> lock(mtx_singleton); // ensure thread safety
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
                static std::shared_ptr<AdapterManager> s = make_shared();
                return s;
            }

            ~AdapterManager() noexcept;

            /**
             * Stops the periodic discovery and releases all adapter.
             * <p>
             * An enumeration in progress is not cancelled, its result is dropped.
             * Pending getAdapters() callbacks receive a DiscoveryStatus::ENUMERATION_FAILURE.
             * </p>
             * <p>
             * Shall not be called from within an AdapterManagerListener callback.
             * </p>
             */
            void close() noexcept;

            /** Returns true if the periodic discovery is running, i.e. not closed. */
            bool isRunning() const noexcept { return discovery_service.is_running(); }

            DiscoveryState getState() const noexcept {
                return reconciling ? DiscoveryState::RECONCILING : DiscoveryState::IDLE;
            }

            DriverRegistry& getDriverRegistry() noexcept { return drivers; }

            /**
             * Triggers an on-demand discovery cycle, same as a periodic one.
             * <p>
             * The given callback is invoked exactly once on the discovery thread,
             * either with the cycle's error or with the snapshot of all live adapter.
             * If closed, the callback is invoked right away with an error.
             * </p>
             */
            void getAdapters(const AdaptersCallback& cb) noexcept;

            /**
             * Triggers an on-demand discovery cycle, same as a periodic one.
             * @return false if closed, otherwise true
             */
            bool triggerDiscovery() noexcept;

            /** Returns the snapshot of all live adapter without triggering a discovery cycle. */
            AdapterMap getAdapterSnapshot() const noexcept { return registry.getAdapterMap(); }

            /** Returns the adapter with the given instance id or nullptr if not present. */
            SerialAdapterRef getAdapter(const std::string& instanceId) const noexcept { return registry.getAdapter(instanceId); }

            size_type getAdapterCount() const noexcept { return registry.getAdapterCount(); }

            /**
             * Adds the given listener, if not yet contained.
             * <p>
             * When newly added, all live adapter are reported as added to the given listener,
             * this allows a fully event driven workflow.
             * </p>
             * <p>
             * Adding and replay are exclusive to a discovery cycle's event dispatch,
             * hence each live adapter is reported exactly once, either replayed or via a later event.
             * </p>
             * @return true if newly added, otherwise false
             */
            bool addListener(const AdapterManagerListenerRef& l) noexcept;

            /**
             * Removes the given listener.
             * @return true if removed, otherwise false
             */
            bool removeListener(const AdapterManagerListenerRef& l) noexcept;

            /**
             * Removes all listener.
             * @return the number of removed listener
             */
            size_type removeAllListener() noexcept;

            size_type getListenerCount() const noexcept { return listenerList.size(); }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<AdapterManager> AdapterManagerRef;

    /**@}*/

} // namespace serial_bt

#endif /* SBT_ADAPTER_MANAGER_HPP_ */
