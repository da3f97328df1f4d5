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

#include <unordered_map>
#include <unordered_set>

#include <jau/debug.hpp>

#include "AdapterRegistry.hpp"

using namespace serial_bt;

std::string ReconcileResult::toString() const noexcept {
    return "Reconcile[added "+std::to_string(added.size())+", removed "+std::to_string(removed.size())+
           ", errors "+std::to_string(errors.size())+"]";
}

AdapterRegistry::AdapterRegistry(const DriverRegistry& drivers_, LifecycleBroadcaster& broadcaster_,
                                 const HostPlatform platform_) noexcept
: drivers(drivers_), broadcaster(broadcaster_), platform(platform_)
{ }

SerialAdapterRef AdapterRegistry::createAdapter(const AdapterClassifier::ClassificationResult& c, const RawDeviceDescriptor& d,
                                                DiscoveryError& error) noexcept
{
    DriverBackendRef backend = drivers.getBackend(c.generation);
    if( nullptr == backend ) {
        error = DiscoveryError(DiscoveryStatus::ADAPTER_CREATION_FAILED, c.instanceId,
                               "No driver backend registered for "+to_string(c.generation));
        return nullptr;
    }
    std::unique_ptr<DriverAdapter> driverAdapter;
    try {
        driverAdapter = backend->createAdapter();
    } catch (std::exception &e) {
        error = DiscoveryError(DiscoveryStatus::ADAPTER_CREATION_FAILED, c.instanceId,
                               backend->toString()+": Caught exception "+e.what());
        return nullptr;
    }
    if( nullptr == driverAdapter ) {
        error = DiscoveryError(DiscoveryStatus::ADAPTER_CREATION_FAILED, c.instanceId,
                               backend->toString()+": Adapter object is null");
        return nullptr;
    }
    if( driverAdapter->getGeneration() != c.generation ) {
        WARN_PRINT("AdapterRegistry::createAdapter: %s created %s, expected driver %s",
                backend->toString().c_str(), driverAdapter->toString().c_str(), to_string(c.generation).c_str());
    }
    return SerialAdapter::make_shared(c.instanceId, c.generation, std::move(driverAdapter), d,
                                      AdapterClassifier::getPlatformAdvisory(platform, d.manufacturer));
}

ReconcileResult AdapterRegistry::reconcile(const jau::darray<RawDeviceDescriptor>& devices) noexcept {
    ReconcileResult res;

    const std::lock_guard<std::recursive_mutex> lock(adapters.get_write_mutex()); // RAII-style acquire and relinquish via destructor
    adapters_t::storage_ref_t old_store = adapters.snapshot();

    std::unordered_map<std::string, SerialAdapterRef> present;
    std::unordered_set<std::string> candidatesForRemoval;
    for(const SerialAdapterRef& a : *old_store) {
        present.emplace(a->getInstanceId(), a);
        candidatesForRemoval.insert(a->getInstanceId());
    }

    for(const RawDeviceDescriptor& d : devices) {
        std::string instanceId;
        const DiscoveryStatus idStatus = AdapterClassifier::getInstanceId(d, instanceId);
        if( DiscoveryStatus::SUCCESS != idStatus ) {
            DBG_PRINT("AdapterRegistry::reconcile: Failed to get adapter instanceId: %s", d.toString().c_str());
            res.errors.push_back( DiscoveryError(idStatus, instanceId, "Failed to get adapter instanceId: "+d.toString()) );
            continue;
        }
        if( present.end() != present.find(instanceId) ) {
            candidatesForRemoval.erase(instanceId); // survives
            continue;
        }
        const AdapterClassifier::ClassificationResult c = AdapterClassifier::classify(d);
        if( !c.isSuccess() ) {
            DBG_PRINT("AdapterRegistry::reconcile: %s: %s", c.toString().c_str(), d.toString().c_str());
            std::string msg;
            if( DiscoveryStatus::UNSUPPORTED_HARDWARE == c.status ) {
                msg = "Unsupported nRF5 development kit: "+d.toString();
            } else {
                msg = "Not able to determine version of driver to use: "+d.toString();
            }
            res.errors.push_back( DiscoveryError(c.status, c.instanceId, msg) );
            continue;
        }
        DiscoveryError error;
        SerialAdapterRef adapter = createAdapter(c, d, error);
        if( nullptr == adapter ) {
            DBG_PRINT("AdapterRegistry::reconcile: %s", error.toString().c_str());
            res.errors.push_back( error );
            continue;
        }
        broadcaster.attach(adapter);
        present.emplace(instanceId, adapter);
        res.added.push_back(adapter);
    }

    adapters_t::storage_ref_t new_store = std::make_shared<adapters_t::storage_t>();
    for(const SerialAdapterRef& a : *old_store) {
        if( candidatesForRemoval.end() != candidatesForRemoval.find(a->getInstanceId()) ) {
            broadcaster.detach(a);
            res.removed.push_back(a);
        } else {
            new_store->push_back(a);
        }
    }
    for(const SerialAdapterRef& a : res.added) {
        new_store->push_back(a);
    }
    if( res.hasChanges() ) {
        adapters.set_store(std::move(new_store));
    }
    DBG_PRINT("AdapterRegistry::reconcile: %zu devices -> %s, %zu adapter",
            (size_t)devices.size(), res.toString().c_str(), (size_t)adapters.size());
    return res;
}

AdapterMap AdapterRegistry::getAdapterMap() const noexcept {
    AdapterMap res;
    adapters_t::storage_ref_t store = adapters.snapshot();
    for(const SerialAdapterRef& a : *store) {
        res.emplace(a->getInstanceId(), a);
    }
    return res;
}

SerialAdapterRef AdapterRegistry::getAdapter(const std::string& instanceId) const noexcept {
    adapters_t::storage_ref_t store = adapters.snapshot();
    for(const SerialAdapterRef& a : *store) {
        if( a->getInstanceId() == instanceId ) {
            return a;
        }
    }
    return nullptr;
}

jau::darray<SerialAdapterRef> AdapterRegistry::clear() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(adapters.get_write_mutex()); // RAII-style acquire and relinquish via destructor
    jau::darray<SerialAdapterRef> removed = *adapters.snapshot();
    for(const SerialAdapterRef& a : removed) {
        broadcaster.detach(a);
    }
    adapters.clear();
    return removed;
}

std::string AdapterRegistry::toString() const noexcept {
    std::string res = "AdapterRegistry["+std::to_string(adapters.size())+" adapter: ";
    adapters_t::storage_ref_t store = adapters.snapshot();
    bool comma = false;
    for(const SerialAdapterRef& a : *store) {
        if( comma ) {
            res.append(", ");
        }
        res.append(a->getInstanceId());
        comma = true;
    }
    res.append("]");
    return res;
}
