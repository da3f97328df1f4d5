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
#include <cstdio>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "SerialAdapter.hpp"

using namespace serial_bt;

SerialAdapter::stateListenerList_t::equal_comparator SerialAdapter::stateListenerRefEqComparator =
        [](const AdapterStateListenerRef &a, const AdapterStateListenerRef &b) -> bool { return *a == *b; };

SerialAdapter::SerialAdapter(const SerialAdapter::ctor_cookie& cc,
                             std::string instanceId_, const DriverGeneration generation_,
                             std::unique_ptr<DriverAdapter> driverAdapter_,
                             const RawDeviceDescriptor& d, std::string notSupportedMessage_) noexcept
: instanceId(std::move(instanceId_)), generation(generation_),
  comName(d.comName), serialNumber(d.serialNumber), manufacturer(d.manufacturer),
  notSupportedMessage(std::move(notSupportedMessage_)),
  ts_creation(jau::getCurrentMilliseconds()),
  driverAdapter(std::move(driverAdapter_)),
  is_open(false)
{
    (void)cc;
    DBG_PRINT("SerialAdapter::ctor: %s", toString().c_str());
}

SerialAdapter::~SerialAdapter() noexcept {
    DBG_PRINT("SerialAdapter::dtor: %s", toString().c_str());
    stateListenerList.clear();
    if( is_open ) {
        is_open = false;
        driverAdapter->close();
    }
}

void SerialAdapter::sendAdapterOpened() noexcept {
    SerialAdapterRef self = shared_from_this();
    int i=0;
    jau::for_each_fidelity(stateListenerList, [&](AdapterStateListenerRef &l) {
        try {
            l->adapterOpened(self);
        } catch (std::exception &e) {
            ERR_PRINT("SerialAdapter::sendAdapterOpened-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, stateListenerList.size(),
                    l->toString().c_str(), toString().c_str(), e.what());
        }
        i++;
    });
}

void SerialAdapter::sendAdapterClosed() noexcept {
    SerialAdapterRef self = shared_from_this();
    int i=0;
    jau::for_each_fidelity(stateListenerList, [&](AdapterStateListenerRef &l) {
        try {
            l->adapterClosed(self);
        } catch (std::exception &e) {
            ERR_PRINT("SerialAdapter::sendAdapterClosed-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, stateListenerList.size(),
                    l->toString().c_str(), toString().c_str(), e.what());
        }
        i++;
    });
}

bool SerialAdapter::open() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    if( is_open ) {
        DBG_PRINT("SerialAdapter::open: Already open: %s", toString().c_str());
        return true;
    }
    if( !driverAdapter->open(comName) ) {
        WARN_PRINT("SerialAdapter::open: Driver open failed: %s, driver %s", toString().c_str(), driverAdapter->toString().c_str());
        return false;
    }
    is_open = true;
    DBG_PRINT("SerialAdapter::open: %s", toString().c_str());
    sendAdapterOpened();
    return true;
}

bool SerialAdapter::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    if( !is_open ) {
        DBG_PRINT("SerialAdapter::close: Not open: %s", toString().c_str());
        return false;
    }
    driverAdapter->close();
    is_open = false;
    DBG_PRINT("SerialAdapter::close: %s", toString().c_str());
    sendAdapterClosed();
    return true;
}

bool SerialAdapter::addStateListener(const AdapterStateListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdapterStateListener ref is null");
        return false;
    }
    return stateListenerList.push_back_unique(l, stateListenerRefEqComparator);
}

bool SerialAdapter::removeStateListener(const AdapterStateListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdapterStateListener ref is null");
        return false;
    }
    const size_type count = stateListenerList.erase_matching(l, false /* all_matching */, stateListenerRefEqComparator);
    return count > 0;
}

SerialAdapter::size_type SerialAdapter::removeAllStateListener() noexcept {
    const size_type count = stateListenerList.size();
    stateListenerList.clear();
    return count;
}

std::string SerialAdapter::toString() const noexcept {
    std::string res = "SerialAdapter[id '"+instanceId+"', driver "+to_string(generation)+
                      ", port '"+comName+"', serial '"+serialNumber+"', open "+std::to_string(is_open.load())+
                      ", listener "+std::to_string(stateListenerList.size());
    if( hasNotSupportedMessage() ) {
        res.append(", advisory '"+notSupportedMessage+"'");
    }
    res.append("]");
    return res;
}
