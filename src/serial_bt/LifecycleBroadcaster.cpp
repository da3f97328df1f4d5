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

#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "LifecycleBroadcaster.hpp"

using namespace serial_bt;

void LifecycleBroadcaster::Forwarder::adapterOpened(const SerialAdapterRef& adapter) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_forward); // RAII-style acquire and relinquish via destructor
    if( attached ) {
        sink.adapterOpened(adapter);
    }
}

void LifecycleBroadcaster::Forwarder::adapterClosed(const SerialAdapterRef& adapter) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_forward); // RAII-style acquire and relinquish via destructor
    if( attached ) {
        sink.adapterClosed(adapter);
    }
}

void LifecycleBroadcaster::Forwarder::disable() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_forward); // RAII-style acquire and relinquish via destructor
    attached = false;
}

std::string LifecycleBroadcaster::Forwarder::toString() const noexcept {
    SerialAdapterRef a = getAdapter();
    return "LifecycleForwarder[attached "+std::to_string(attached.load())+", "+
           ( nullptr != a ? a->getInstanceId() : std::string("null") )+"]";
}

LifecycleBroadcaster::LifecycleBroadcaster(AdapterStateListener& sink_) noexcept
: sink(sink_)
{ }

LifecycleBroadcaster::~LifecycleBroadcaster() noexcept {
    detachAll();
}

void LifecycleBroadcaster::detachImpl(const ForwarderRef& f, const SerialAdapterRef& adapter) noexcept {
    f->disable();
    if( nullptr != adapter ) {
        adapter->removeStateListener(f);
    }
}

bool LifecycleBroadcaster::attach(const SerialAdapterRef& adapter) noexcept {
    if( nullptr == adapter ) {
        ERR_PRINT("SerialAdapter ref is null");
        return false;
    }
    const std::lock_guard<std::mutex> lock(mtx_forwarder); // RAII-style acquire and relinquish via destructor
    auto it = forwarders.find(adapter->getInstanceId());
    if( forwarders.end() != it ) {
        DBG_PRINT("LifecycleBroadcaster::attach: Already attached: %s", adapter->toString().c_str());
        return false;
    }
    ForwarderRef f = std::make_shared<Forwarder>(sink, adapter);
    adapter->addStateListener(f);
    forwarders.emplace(adapter->getInstanceId(), f);
    DBG_PRINT("LifecycleBroadcaster::attach: %s", adapter->toString().c_str());
    return true;
}

bool LifecycleBroadcaster::detach(const SerialAdapterRef& adapter) noexcept {
    if( nullptr == adapter ) {
        ERR_PRINT("SerialAdapter ref is null");
        return false;
    }
    const std::lock_guard<std::mutex> lock(mtx_forwarder); // RAII-style acquire and relinquish via destructor
    auto it = forwarders.find(adapter->getInstanceId());
    if( forwarders.end() == it ) {
        DBG_PRINT("LifecycleBroadcaster::detach: Not attached: %s", adapter->toString().c_str());
        return false;
    }
    detachImpl(it->second, adapter);
    forwarders.erase(it);
    DBG_PRINT("LifecycleBroadcaster::detach: %s", adapter->toString().c_str());
    return true;
}

LifecycleBroadcaster::size_type LifecycleBroadcaster::detachAll() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_forwarder); // RAII-style acquire and relinquish via destructor
    const size_type count = static_cast<size_type>( forwarders.size() );
    for(auto& p : forwarders) {
        detachImpl(p.second, p.second->getAdapter());
    }
    forwarders.clear();
    return count;
}

bool LifecycleBroadcaster::isAttached(const std::string& instanceId) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_forwarder); // RAII-style acquire and relinquish via destructor
    return forwarders.end() != forwarders.find(instanceId);
}

LifecycleBroadcaster::size_type LifecycleBroadcaster::getAttachedCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_forwarder); // RAII-style acquire and relinquish via destructor
    return static_cast<size_type>( forwarders.size() );
}
