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
#include <cinttypes>
#include <chrono>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>
#include <jau/basic_types.hpp>

#include "AdapterManager.hpp"

using namespace serial_bt;

DiscoveryEnv::DiscoveryEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("serial_bt").debug ),
  exploding( jau::environment::getExplodingProperties("serial_bt.discovery") ),
  DISCOVERY_INTERVAL( jau::environment::getInt32Property("serial_bt.discovery.interval", DISCOVERY_INTERVAL_MS, 100 /* min */, INT32_MAX /* max */) ),
  ENUMERATE_TIMEOUT( jau::environment::getInt32Property("serial_bt.discovery.enumerate.timeout", ENUMERATE_TIMEOUT_MS, 500 /* min */, INT32_MAX /* max */) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("serial_bt.debug.discovery.event", false) )
{
}

std::string serial_bt::to_string(const DiscoveryState v) noexcept {
    switch(v) {
        case DiscoveryState::IDLE: return "IDLE";
        case DiscoveryState::RECONCILING: return "RECONCILING";
    }
    return "Unknown DiscoveryState";
}

std::mutex AdapterManager::mtx_singleton;
jau::sc_atomic_bool AdapterManager::instance_created( false );

AdapterManager::listenerList_t::equal_comparator AdapterManager::listenerRefEqComparator =
        [](const AdapterManagerListenerRef& a, const AdapterManagerListenerRef& b) -> bool { return *a == *b; };

void AdapterManager::StateSink::adapterOpened(const SerialAdapterRef& adapter) {
    mngr.sendAdapterOpened(adapter);
}

void AdapterManager::StateSink::adapterClosed(const SerialAdapterRef& adapter) {
    mngr.sendAdapterClosed(adapter);
}

AdapterManager::AdapterManager(const AdapterManager::ctor_cookie& cc, DriverRegistry& drivers_)
: env(DiscoveryEnv::get()), drivers(drivers_),
  stateSink(*this), broadcaster(stateSink), registry(drivers_, broadcaster),
  discoveryRequested(false), reconciling(false),
  enumerateCycle(0), enumerateCompleted(false),
  discovery_service("AdapterManager::discovery", THREAD_SHUTDOWN_TIMEOUT_MS,
                    jau::bind_member(this, &AdapterManager::discoveryWork),
                    jau::service_runner::Callback() /* init */,
                    jau::bind_member(this, &AdapterManager::discoveryEndLocked))
{
    (void)cc;
    if( instance_created ) {
        throw jau::IllegalStateException("AdapterManager already created", E_FILE_LINE);
    }
    instance_created = true;
}

void AdapterManager::start() noexcept {
    discovery_service.start();
    DBG_PRINT("AdapterManager::start: interval %d ms, enumerate timeout %d ms, %s",
            env.DISCOVERY_INTERVAL, env.ENUMERATE_TIMEOUT, drivers.toString().c_str());
}

AdapterManager::~AdapterManager() noexcept {
    DBG_PRINT("AdapterManager::dtor");
    close();
}

void AdapterManager::close() noexcept {
    DBG_PRINT("AdapterManager::close: Start: %s", toString().c_str());
    {
        const std::lock_guard<std::mutex> lock(mtx_discovery); // RAII-style acquire and relinquish via destructor
        discovery_service.set_shall_stop();
    }
    cv_discovery.notify_all();
    {
        const std::lock_guard<std::mutex> lock(mtx_enumerate); // RAII-style acquire and relinquish via destructor
    }
    cv_enumerate.notify_all();
    discovery_service.stop();

    jau::darray<AdaptersCallback> callbacks;
    {
        const std::lock_guard<std::mutex> lock(mtx_discovery); // RAII-style acquire and relinquish via destructor
        callbacks = std::move(pendingCallbacks);
        pendingCallbacks.clear();
        discoveryRequested = false;
    }
    if( callbacks.size() > 0 ) {
        const AdapterMap empty;
        invokeCallbacks(callbacks, DiscoveryError(DiscoveryStatus::ENUMERATION_FAILURE, "", "AdapterManager closed"), empty);
    }

    const jau::darray<SerialAdapterRef> removed = registry.clear();
    listenerList.clear();
    DBG_PRINT("AdapterManager::close: End: Released %zu adapter", (size_t)removed.size());
}

void AdapterManager::discoveryWork(jau::service_runner& sr) noexcept {
    jau::darray<AdaptersCallback> callbacks;
    {
        std::unique_lock<std::mutex> lock(mtx_discovery); // RAII-style acquire and relinquish via destructor
        if( !discoveryRequested && !sr.shall_stop() ) {
            cv_discovery.wait_for(lock, std::chrono::milliseconds(env.DISCOVERY_INTERVAL),
                                  [&]{ return discoveryRequested || sr.shall_stop(); });
        }
        if( sr.shall_stop() ) {
            return;
        }
        // all requests up to now are served by this cycle
        discoveryRequested = false;
        callbacks = std::move(pendingCallbacks);
        pendingCallbacks.clear();
    }
    runDiscoveryCycle(callbacks);
}

void AdapterManager::discoveryEndLocked(jau::service_runner& sr) noexcept {
    (void)sr;
    reconciling = false;
    DBG_PRINT("AdapterManager::discovery: Ended");
}

void AdapterManager::runDiscoveryCycle(jau::darray<AdaptersCallback>& callbacks) noexcept {
    reconciling = true;
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::discovery: Cycle start, %zu callbacks", (size_t)callbacks.size());

    jau::darray<RawDeviceDescriptor> devices;
    const DiscoveryError enumError = enumerate(devices);
    if( enumError.isError() ) {
        WARN_PRINT("AdapterManager::discovery: %s", enumError.toString().c_str());
        sendDiscoveryError(*listenerList.snapshot(), enumError);
        reconciling = false;
        const AdapterMap empty;
        invokeCallbacks(callbacks, enumError, empty);
        return;
    }

    ReconcileResult res;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_membership); // RAII-style acquire and relinquish via destructor
        res = registry.reconcile(devices);
        const listenerList_t::storage_ref_t listeners = listenerList.snapshot();
        for(const DiscoveryError& e : res.errors) {
            sendDiscoveryError(*listeners, e);
        }
        for(const SerialAdapterRef& a : res.added) {
            sendAdapterAdded(*listeners, a);
        }
        for(const SerialAdapterRef& a : res.removed) {
            sendAdapterRemoved(*listeners, a);
        }
    }
    reconciling = false;
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::discovery: Cycle end, %zu devices, %s", (size_t)devices.size(), res.toString().c_str());

    if( callbacks.size() > 0 ) {
        const AdapterMap adapters = registry.getAdapterMap();
        invokeCallbacks(callbacks, DiscoveryError(), adapters);
    }
}

DiscoveryError AdapterManager::enumerate(jau::darray<RawDeviceDescriptor>& devices) noexcept {
    DriverBackendRef enumerator = drivers.getEnumerator();
    if( nullptr == enumerator ) {
        return DiscoveryError(DiscoveryStatus::NO_DRIVER, "",
                "No enumerating driver backend registered for "+to_string(drivers.getEnumeratorGeneration()));
    }
    uint64_t cycle;
    {
        const std::lock_guard<std::mutex> lock(mtx_enumerate); // RAII-style acquire and relinquish via destructor
        cycle = ++enumerateCycle;
        enumerateCompleted = false;
        enumerateError = DiscoveryError();
        enumerateDevices.clear();
    }
    const std::weak_ptr<AdapterManager> wbr_self = weak_from_this();
    enumerator->enumerate( [wbr_self, cycle](const DiscoveryError& error, const jau::darray<RawDeviceDescriptor>& result) {
        std::shared_ptr<AdapterManager> self = wbr_self.lock();
        if( nullptr == self ) {
            WARN_PRINT("AdapterManager::enumerateDone: Dropped completion of cycle %" PRIu64 ", manager destroyed: %s, %zu devices",
                    cycle, error.toString().c_str(), (size_t)result.size());
            return;
        }
        self->enumerateDone(cycle, error, result);
    } );

    std::unique_lock<std::mutex> lock(mtx_enumerate); // RAII-style acquire and relinquish via destructor
    cv_enumerate.wait_for(lock, std::chrono::milliseconds(env.ENUMERATE_TIMEOUT),
                          [&]{ return enumerateCompleted || discovery_service.shall_stop(); });
    if( !enumerateCompleted ) {
        ++enumerateCycle; // drop late completion
        if( discovery_service.shall_stop() ) {
            return DiscoveryError(DiscoveryStatus::ENUMERATION_FAILURE, "", "AdapterManager closed");
        }
        return DiscoveryError(DiscoveryStatus::ENUMERATION_FAILURE, "",
                enumerator->toString()+": Enumeration timeout after "+std::to_string(env.ENUMERATE_TIMEOUT)+" ms");
    }
    if( enumerateError.isError() ) {
        return DiscoveryError(DiscoveryStatus::ENUMERATION_FAILURE, enumerateError.instanceId, enumerateError.message);
    }
    devices = std::move(enumerateDevices);
    enumerateDevices.clear();
    return DiscoveryError();
}

void AdapterManager::enumerateDone(const uint64_t cycle, const DiscoveryError& error, const jau::darray<RawDeviceDescriptor>& devices) noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_enumerate); // RAII-style acquire and relinquish via destructor
        if( cycle != enumerateCycle || enumerateCompleted ) {
            WARN_PRINT("AdapterManager::enumerateDone: Dropped completion of cycle %" PRIu64 ", current %" PRIu64 ": %s, %zu devices",
                    cycle, enumerateCycle, error.toString().c_str(), (size_t)devices.size());
            return;
        }
        enumerateCompleted = true;
        enumerateError = error;
        enumerateDevices = devices;
    }
    cv_enumerate.notify_all(); // have mutex unlocked before notify_all to avoid pessimistic re-block of notified wait() thread.
}

void AdapterManager::invokeCallbacks(jau::darray<AdaptersCallback>& callbacks, const DiscoveryError& error, const AdapterMap& adapters) noexcept {
    int i=0;
    for(AdaptersCallback& cb : callbacks) {
        try {
            cb(error, adapters);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterManager::getAdapters-CBs %d/%zu: Caught exception %s",
                    i+1, (size_t)callbacks.size(), e.what());
        }
        ++i;
    }
}

void AdapterManager::getAdapters(const AdaptersCallback& cb) noexcept {
    bool queued = false;
    {
        const std::lock_guard<std::mutex> lock(mtx_discovery); // RAII-style acquire and relinquish via destructor
        if( !discovery_service.shall_stop() ) {
            pendingCallbacks.push_back(cb);
            discoveryRequested = true;
            queued = true;
        }
    }
    if( queued ) {
        cv_discovery.notify_all(); // have mutex unlocked before notify_all to avoid pessimistic re-block of notified wait() thread.
    } else {
        jau::darray<AdaptersCallback> callbacks;
        callbacks.push_back(cb);
        const AdapterMap empty;
        invokeCallbacks(callbacks, DiscoveryError(DiscoveryStatus::ENUMERATION_FAILURE, "", "AdapterManager closed"), empty);
    }
}

bool AdapterManager::triggerDiscovery() noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_discovery); // RAII-style acquire and relinquish via destructor
        if( discovery_service.shall_stop() ) {
            return false;
        }
        discoveryRequested = true;
    }
    cv_discovery.notify_all(); // have mutex unlocked before notify_all to avoid pessimistic re-block of notified wait() thread.
    return true;
}

bool AdapterManager::addListener(const AdapterManagerListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdapterManagerListener ref is null");
        return false;
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_membership); // RAII-style acquire and relinquish via destructor
    const bool added = listenerList.push_back_unique(l, listenerRefEqComparator);
    if( added ) {
        jau::darray<SerialAdapterRef> adapters = registry.getAdapters();
        for(const SerialAdapterRef& a : adapters) {
            try {
                l->adapterAdded(a);
            } catch (std::exception &e) {
                ERR_PRINT("AdapterManager::addListener: %s of %s: Caught exception %s",
                        l->toString().c_str(), a->toString().c_str(), e.what());
            }
        }
    }
    return added;
}

bool AdapterManager::removeListener(const AdapterManagerListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdapterManagerListener ref is null");
        return false;
    }
    const size_type count = listenerList.erase_matching(l, false /* all_matching */, listenerRefEqComparator);
    return count > 0;
}

AdapterManager::size_type AdapterManager::removeAllListener() noexcept {
    const size_type count = listenerList.size();
    listenerList.clear();
    return count;
}

void AdapterManager::sendAdapterAdded(const listenerList_t::storage_t& listeners, const SerialAdapterRef& adapter) noexcept {
    int i=0;
    for(const AdapterManagerListenerRef& l : listeners) {
        try {
            l->adapterAdded(adapter);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterManager::sendAdapterAdded: %d/%zd: %s of %s: Caught exception %s",
                    i+1, listeners.size(),
                    l->toString().c_str(), adapter->toString().c_str(), e.what());
        }
        i++;
    }
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::added: %s -> %d listener", adapter->toString().c_str(), i);
}

void AdapterManager::sendAdapterRemoved(const listenerList_t::storage_t& listeners, const SerialAdapterRef& adapter) noexcept {
    int i=0;
    for(const AdapterManagerListenerRef& l : listeners) {
        try {
            l->adapterRemoved(adapter);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterManager::sendAdapterRemoved: %d/%zd: %s of %s: Caught exception %s",
                    i+1, listeners.size(),
                    l->toString().c_str(), adapter->toString().c_str(), e.what());
        }
        i++;
    }
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::removed: %s -> %d listener", adapter->toString().c_str(), i);
}

void AdapterManager::sendAdapterOpened(const SerialAdapterRef& adapter) noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](AdapterManagerListenerRef &l) {
        try {
            l->adapterOpened(adapter);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterManager::sendAdapterOpened: %d/%zd: %s of %s: Caught exception %s",
                    i+1, listenerList.size(),
                    l->toString().c_str(), adapter->toString().c_str(), e.what());
        }
        i++;
    });
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::opened: %s -> %d listener", adapter->toString().c_str(), i);
}

void AdapterManager::sendAdapterClosed(const SerialAdapterRef& adapter) noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](AdapterManagerListenerRef &l) {
        try {
            l->adapterClosed(adapter);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterManager::sendAdapterClosed: %d/%zd: %s of %s: Caught exception %s",
                    i+1, listenerList.size(),
                    l->toString().c_str(), adapter->toString().c_str(), e.what());
        }
        i++;
    });
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::closed: %s -> %d listener", adapter->toString().c_str(), i);
}

void AdapterManager::sendDiscoveryError(const listenerList_t::storage_t& listeners, const DiscoveryError& error) noexcept {
    int i=0;
    for(const AdapterManagerListenerRef& l : listeners) {
        try {
            l->discoveryError(error);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterManager::sendDiscoveryError: %d/%zd: %s of %s: Caught exception %s",
                    i+1, listeners.size(),
                    l->toString().c_str(), error.toString().c_str(), e.what());
        }
        i++;
    }
    COND_PRINT(env.DEBUG_EVENT, "AdapterManager::error: %s -> %d listener", error.toString().c_str(), i);
}

std::string AdapterManager::toString() const noexcept {
    return "AdapterManager[running "+std::to_string(isRunning())+", state "+to_string(getState())+
           ", "+registry.toString()+", listener "+std::to_string(listenerList.size())+"]";
}
