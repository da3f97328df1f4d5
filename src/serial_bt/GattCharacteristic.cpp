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

#include "GattCharacteristic.hpp"

using namespace serial_bt;

#define CHAR_DECL_PROPS_ENUM(X) \
        X(GattCharacteristic,NONE,none) \
        X(GattCharacteristic,Broadcast,broadcast) \
        X(GattCharacteristic,Read,read) \
        X(GattCharacteristic,WriteNoAck,write-without-response) \
        X(GattCharacteristic,WriteWithAck,write) \
        X(GattCharacteristic,Notify,notify) \
        X(GattCharacteristic,Indicate,indicate) \
        X(GattCharacteristic,AuthSignedWrite,authenticated-signed-writes) \
        X(GattCharacteristic,ExtProps,extended-properties)

#define CASE2_TO_STRING2(U,V,W) case U::V: return #W;

static std::string _getPropertyBitValStr(const GattCharacteristic::PropertyBitVal prop) noexcept {
    switch(prop) {
        CHAR_DECL_PROPS_ENUM(CASE2_TO_STRING2)
        default: ; // fall through intended
    }
    return "Unknown property";
}

std::string serial_bt::to_string(const GattCharacteristic::PropertyBitVal mask) noexcept {
    const GattCharacteristic::PropertyBitVal none = GattCharacteristic::PropertyBitVal::NONE;
    const uint8_t one = 1;
    bool has_pre = false;
    std::string out("[");
    for(int i=0; i<8; i++) {
        const GattCharacteristic::PropertyBitVal propertyBit = static_cast<GattCharacteristic::PropertyBitVal>( one << i );
        if( none != ( mask & propertyBit ) ) {
            if( has_pre ) { out.append(", "); }
            out.append(_getPropertyBitValStr(propertyBit));
            has_pre = true;
        }
    }
    out.append("]");
    return out;
}

jau::sc_atomic_uint32 GattCharacteristic::next_id( 1 );

GattCharacteristic::GattCharacteristic(const std::string& serviceInstanceId_, const std::string& uuid_,
                                       const PropertyBitVal properties_, const jau::TROOctets& value_)
: instanceId( serviceInstanceId_+"."+std::to_string( next_id++ ) ),
  serviceInstanceId(serviceInstanceId_), uuid(uuid_), name(),
  properties(properties_), value(value_)
{ }

bool GattCharacteristic::hasProperties(const PropertyBitVal v) const noexcept {
    return v == ( properties & v );
}

std::string GattCharacteristic::toString() const noexcept {
    return "GattChar["+instanceId+", uuid "+uuid+", name '"+getName()+"', props "+to_string(properties)+
           ", value "+value.toString()+"]";
}
