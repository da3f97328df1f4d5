#include <iostream>
#include <cinttypes>
#include <cstring>
#include <cstdlib>

#include <chrono>
#include <thread>

#include <catch2/catch_test_macros.hpp>

#include <serial_bt/AdapterManager.hpp>

#include "sbt_test_drivers.hpp"
#include "sbt_test_listener.hpp"

using namespace serial_bt;
using namespace serial_bt_test;

static FakeDriverBackendRef fakeV2;

static AdapterManager& getManager() {
    static bool initialized = false;
    if( !initialized ) {
        // periodic cycles only, no on-demand request issued by these tests
        ::setenv("serial_bt.discovery.interval", "100", 1 /* overwrite */);
        ::setenv("serial_bt.discovery.enumerate.timeout", "500", 1 /* overwrite */);
        fakeV2 = std::make_shared<FakeDriverBackend>(DriverGeneration::SD_API_V2);
        DriverRegistry::get().registerBackend(fakeV2);
        initialized = true;
    }
    return *AdapterManager::get();
}

TEST_CASE( "Periodic Discovery Add Remove Test 01", "[manager][periodic]" ) {
    AdapterManager& mngr = getManager();
    REQUIRE( 100 == DiscoveryEnv::get().DISCOVERY_INTERVAL );
    RecordingListenerRef l = std::make_shared<RecordingListener>();
    REQUIRE( true == mngr.addListener(l) );

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER") }) );
    REQUIRE( true == wait_until([&]{ return 1 <= l->addedCount(); }, 5000) );
    const SerialAdapterRef a = l->addedAt(0);
    REQUIRE( "680123456" == a->getInstanceId() );
    REQUIRE( a == mngr.getAdapter("680123456") );

    // further ticks with unchanged devices emit nothing
    const int enumerateCount0 = fakeV2->enumerateCount;
    REQUIRE( true == wait_until([&]{ return fakeV2->enumerateCount >= enumerateCount0 + 3; }, 5000) );
    REQUIRE( 1 == l->addedCount() );
    REQUIRE( 0 == l->removedCount() );

    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    REQUIRE( true == wait_until([&]{ return 1 <= l->removedCount(); }, 5000) );
    REQUIRE( a == l->removedAt(0) );
    REQUIRE( 0 == mngr.getAdapterCount() );
    REQUIRE( 0 == l->errorCount() );
    REQUIRE( true == mngr.removeListener(l) );
}

TEST_CASE( "Periodic Discovery After Failure Test 02", "[manager][periodic][error]" ) {
    AdapterManager& mngr = getManager();
    RecordingListenerRef l = std::make_shared<RecordingListener>();
    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    fakeV2->setEnumerateFailure("USB subsystem unavailable");
    REQUIRE( true == mngr.addListener(l) );

    REQUIRE( true == wait_until([&]{ return 1 <= l->errorCount(); }, 5000) );
    REQUIRE( DiscoveryStatus::ENUMERATION_FAILURE == l->errorAt(0).status );
    REQUIRE( 0 == l->addedCount() );
    REQUIRE( true == mngr.isRunning() );

    // the following tick succeeds
    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("681000001", "/dev/ttyACM0", "SEGGER") }) );
    fakeV2->setEnumerateFailure("");
    REQUIRE( true == wait_until([&]{ return 1 <= l->addedCount(); }, 5000) );
    REQUIRE( "681000001" == l->addedAt(0)->getInstanceId() );
    REQUIRE( DriverGeneration::SD_API_V2 == l->addedAt(0)->getDriverGeneration() );
    REQUIRE( 1 == mngr.getAdapterCount() );
}
