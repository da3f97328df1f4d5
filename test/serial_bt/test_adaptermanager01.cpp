#include <iostream>
#include <cinttypes>
#include <cstring>
#include <cstdlib>

#include <future>
#include <chrono>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <serial_bt/AdapterManager.hpp>

#include "sbt_test_drivers.hpp"
#include "sbt_test_listener.hpp"

using namespace serial_bt;
using namespace serial_bt_test;

struct CycleResult {
    DiscoveryError error;
    AdapterMap adapters;
};

static FakeDriverBackendRef fakeV2;
static FakeDriverBackendRef fakeV3;

static AdapterManager& getManager() {
    static bool initialized = false;
    if( !initialized ) {
        // no periodic cycle during the tests, on-demand only
        ::setenv("serial_bt.discovery.interval", "600000", 1 /* overwrite */);
        ::setenv("serial_bt.discovery.enumerate.timeout", "500", 1 /* overwrite */);
        fakeV2 = std::make_shared<FakeDriverBackend>(DriverGeneration::SD_API_V2);
        fakeV3 = std::make_shared<FakeDriverBackend>(DriverGeneration::SD_API_V3);
        DriverRegistry::get().registerBackend(fakeV2);
        DriverRegistry::get().registerBackend(fakeV3);
        initialized = true;
    }
    return *AdapterManager::get();
}

static CycleResult runCycle(AdapterManager& mngr) {
    std::shared_ptr<std::promise<CycleResult>> p = std::make_shared<std::promise<CycleResult>>();
    std::future<CycleResult> f = p->get_future();
    mngr.getAdapters( [p](const DiscoveryError& error, const AdapterMap& adapters) {
        p->set_value( CycleResult { error, adapters } );
    } );
    REQUIRE( std::future_status::ready == f.wait_for(std::chrono::seconds(5)) );
    return f.get();
}

/** Empty device list, no failures, no listener. */
static void resetManager(AdapterManager& mngr) {
    mngr.removeAllListener();
    fakeV2->setSilent(false);
    fakeV2->setEnumerateFailure("");
    fakeV2->setCreateFailure(false, false);
    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    const CycleResult r = runCycle(mngr);
    REQUIRE( false == r.error.isError() );
    REQUIRE( 0 == mngr.getAdapterCount() );
}

TEST_CASE( "Singleton Test 01", "[manager][singleton]" ) {
    AdapterManager& mngr = getManager();
    REQUIRE( &mngr == AdapterManager::get().get() );
    REQUIRE( AdapterManager::get() == AdapterManager::get() );
    REQUIRE( &DriverRegistry::get() == &mngr.getDriverRegistry() );
    REQUIRE( true == mngr.isRunning() );
    REQUIRE( 600000 == DiscoveryEnv::get().DISCOVERY_INTERVAL );
    REQUIRE( 500 == DiscoveryEnv::get().ENUMERATE_TIMEOUT );
    std::cout << mngr.toString() << std::endl;
}

TEST_CASE( "Discovery Add Remove Test 02", "[manager][discovery]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);
    RecordingListenerRef l = std::make_shared<RecordingListener>();
    REQUIRE( true == mngr.addListener(l) );

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER") }) );
    const CycleResult r1 = runCycle(mngr);
    REQUIRE( false == r1.error.isError() );
    REQUIRE( 1 == r1.adapters.size() );
    const SerialAdapterRef a = r1.adapters.at("680123456");
    REQUIRE( DriverGeneration::SD_API_V2 == a->getDriverGeneration() );
    REQUIRE( 1 == l->addedCount() );
    REQUIRE( a == l->added[0] );
    REQUIRE( a == mngr.getAdapter("680123456") );
    REQUIRE( 1 == mngr.getAdapterSnapshot().size() );
    REQUIRE( DiscoveryState::IDLE == mngr.getState() );

    // unchanged devices, no events
    const CycleResult r2 = runCycle(mngr);
    REQUIRE( false == r2.error.isError() );
    REQUIRE( 1 == r2.adapters.size() );
    REQUIRE( a == r2.adapters.at("680123456") );
    REQUIRE( 1 == l->addedCount() );
    REQUIRE( 0 == l->removedCount() );

    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    const CycleResult r3 = runCycle(mngr);
    REQUIRE( false == r3.error.isError() );
    REQUIRE( 0 == r3.adapters.size() );
    REQUIRE( 1 == l->removedCount() );
    REQUIRE( a == l->removed[0] );

    const CycleResult r4 = runCycle(mngr);
    REQUIRE( 0 == r4.adapters.size() );
    REQUIRE( 1 == l->removedCount() );
    REQUIRE( 0 == l->errorCount() );

    // previously delivered snapshots stay intact
    REQUIRE( 1 == r1.adapters.size() );
    REQUIRE( true == mngr.removeListener(l) );
    REQUIRE( false == mngr.removeListener(l) );
}

TEST_CASE( "Discovery Device Error Test 03", "[manager][discovery][error]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);
    RecordingListenerRef l = std::make_shared<RecordingListener>();
    mngr.addListener(l);

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("", "", "SEGGER") }) );
    const CycleResult r1 = runCycle(mngr);
    REQUIRE( false == r1.error.isError() );
    REQUIRE( 0 == r1.adapters.size() );
    REQUIRE( 1 == l->errorCount() );
    REQUIRE( DiscoveryStatus::MISSING_INSTANCE_ID == l->errors[0].status );
    REQUIRE( 0 == l->addedCount() );

    fakeV2->setDevices( make_devices({
            RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER"),
            RawDeviceDescriptor("", "/dev/ttyUSB0", "FTDI"),
            RawDeviceDescriptor("689000000", "/dev/ttyACM1", "SEGGER") }) );
    const CycleResult r2 = runCycle(mngr);
    REQUIRE( false == r2.error.isError() );
    REQUIRE( 1 == r2.adapters.size() );
    REQUIRE( 3 == l->errorCount() );
    REQUIRE( DiscoveryStatus::UNKNOWN_ADAPTER_VENDOR == l->errors[1].status );
    REQUIRE( DiscoveryStatus::UNSUPPORTED_HARDWARE == l->errors[2].status );
    REQUIRE( 1 == l->addedCount() );
}

TEST_CASE( "Discovery Enumeration Failure Test 04", "[manager][discovery][error]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);
    RecordingListenerRef l = std::make_shared<RecordingListener>();
    mngr.addListener(l);

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("683000001", "/dev/ttyACM0", "SEGGER") }) );
    const CycleResult r1 = runCycle(mngr);
    REQUIRE( 1 == r1.adapters.size() );
    REQUIRE( DriverGeneration::SD_API_V3 == r1.adapters.at("683000001")->getDriverGeneration() );

    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    fakeV2->setEnumerateFailure("USB subsystem unavailable");
    const CycleResult r2 = runCycle(mngr);
    REQUIRE( true == r2.error.isError() );
    REQUIRE( DiscoveryStatus::ENUMERATION_FAILURE == r2.error.status );
    REQUIRE( 0 == r2.adapters.size() );
    REQUIRE( 1 == l->errorCount() );
    REQUIRE( DiscoveryStatus::ENUMERATION_FAILURE == l->errors[0].status );
    // registry untouched
    REQUIRE( 1 == mngr.getAdapterCount() );
    REQUIRE( 0 == l->removedCount() );

    // next cycle runs normally
    fakeV2->setEnumerateFailure("");
    const CycleResult r3 = runCycle(mngr);
    REQUIRE( false == r3.error.isError() );
    REQUIRE( 0 == r3.adapters.size() );
    REQUIRE( 1 == l->removedCount() );
}

TEST_CASE( "Discovery Enumeration Timeout Test 05", "[manager][discovery][error]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER") }) );
    fakeV2->setSilent(true);
    const CycleResult r1 = runCycle(mngr);
    REQUIRE( DiscoveryStatus::ENUMERATION_FAILURE == r1.error.status );
    REQUIRE( 0 == mngr.getAdapterCount() );

    // late completion of the timed out enumeration is dropped
    REQUIRE( true == fakeV2->completeSilent() );
    REQUIRE( false == fakeV2->completeSilent() );
    REQUIRE( 0 == mngr.getAdapterCount() );

    fakeV2->setSilent(false);
    const CycleResult r2 = runCycle(mngr);
    REQUIRE( false == r2.error.isError() );
    REQUIRE( 1 == r2.adapters.size() );
}

TEST_CASE( "Discovery No Driver Test 06", "[manager][discovery][error]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);

    REQUIRE( fakeV2 == DriverRegistry::get().removeBackend(DriverGeneration::SD_API_V2) );
    const CycleResult r1 = runCycle(mngr);
    REQUIRE( DiscoveryStatus::NO_DRIVER == r1.error.status );

    DriverRegistry::get().registerBackend(fakeV2);
    const CycleResult r2 = runCycle(mngr);
    REQUIRE( false == r2.error.isError() );
}

TEST_CASE( "Adapter Session Forwarding Test 07", "[manager][lifecycle]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);
    RecordingListenerRef l = std::make_shared<RecordingListener>();
    mngr.addListener(l);

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER") }) );
    const CycleResult r1 = runCycle(mngr);
    const SerialAdapterRef a = r1.adapters.at("680123456");

    REQUIRE( true == a->open() );
    REQUIRE( 1 == l->openedCount() );
    REQUIRE( a == l->opened[0] );
    REQUIRE( true == a->open() ); // already open
    REQUIRE( 1 == l->openedCount() );
    REQUIRE( true == a->close() );
    REQUIRE( 1 == l->closedCount() );
    REQUIRE( a == l->closed[0] );

    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    runCycle(mngr);
    REQUIRE( 1 == l->removedCount() );

    // removed adapter is silent
    a->open();
    a->close();
    REQUIRE( 1 == l->openedCount() );
    REQUIRE( 1 == l->closedCount() );
}

TEST_CASE( "Listener Replay Test 08", "[manager][listener]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);

    fakeV2->setDevices( make_devices({
            RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER"),
            RawDeviceDescriptor("682000001", "/dev/ttyACM1", "SEGGER") }) );
    runCycle(mngr);
    REQUIRE( 2 == mngr.getAdapterCount() );

    RecordingListenerRef l = std::make_shared<RecordingListener>();
    REQUIRE( true == mngr.addListener(l) );
    REQUIRE( 2 == l->addedCount() );
    REQUIRE( false == mngr.addListener(l) );
    REQUIRE( 2 == l->addedCount() );
    REQUIRE( 1 == mngr.getListenerCount() );

    RecordingListenerRef l2 = std::make_shared<RecordingListener>();
    REQUIRE( true == mngr.addListener(l2) );
    REQUIRE( 2 == l2->addedCount() );
    REQUIRE( 2 == l->addedCount() );
    REQUIRE( 2 == mngr.removeAllListener() );
    REQUIRE( false == mngr.addListener(nullptr) );
}

TEST_CASE( "Collapsed Requests Test 09", "[manager][discovery]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER") }) );
    const int enumerateCount0 = fakeV2->enumerateCount;
    fakeV2->holdEnumeration();
    REQUIRE( true == mngr.triggerDiscovery() );
    REQUIRE( true == fakeV2->waitEnumerationHeld(5000) );
    REQUIRE( enumerateCount0 + 1 == fakeV2->enumerateCount );
    REQUIRE( DiscoveryState::RECONCILING == mngr.getState() );

    // all requests issued during the held cycle are served by one trailing cycle
    const int requests = 8;
    std::shared_ptr<std::mutex> mtx = std::make_shared<std::mutex>();
    std::shared_ptr<std::vector<int>> invoked = std::make_shared<std::vector<int>>(requests, 0);
    std::shared_ptr<jau::sc_atomic_int> sized = std::make_shared<jau::sc_atomic_int>(0);
    for(int i=0; i<requests; ++i) {
        mngr.getAdapters( [i, mtx, invoked, sized](const DiscoveryError& error, const AdapterMap& adapters) {
            if( !error.isError() && 1 == adapters.size() ) {
                (*sized)++;
            }
            const std::lock_guard<std::mutex> lock(*mtx);
            (*invoked)[i]++;
        } );
    }
    fakeV2->releaseEnumeration();

    auto invokedCount = [mtx, invoked]() -> int {
        const std::lock_guard<std::mutex> lock(*mtx);
        int n=0;
        for(int c : *invoked) { n += c; }
        return n;
    };
    REQUIRE( true == wait_until([&]{ return invokedCount() >= requests; }, 5000) );
    std::this_thread::sleep_for(std::chrono::milliseconds(200)); // no late duplicates
    {
        const std::lock_guard<std::mutex> lock(*mtx);
        for(int i=0; i<requests; ++i) {
            REQUIRE( 1 == (*invoked)[i] );
        }
    }
    REQUIRE( requests == *sized );
    REQUIRE( enumerateCount0 + 2 == fakeV2->enumerateCount );
    REQUIRE( 1 == mngr.getAdapterCount() );
}

/** Adds a chained listener from within its first adapterAdded() callback. */
class ChainingListener : public RecordingListener {
    private:
        AdapterManager& mngr;
        RecordingListenerRef chained;
        jau::sc_atomic_bool chainedAdded;

    public:
        ChainingListener(AdapterManager& mngr_, const RecordingListenerRef& chained_)
        : mngr(mngr_), chained(chained_), chainedAdded(false) {}

        void adapterAdded(const SerialAdapterRef& adapter) override {
            RecordingListener::adapterAdded(adapter);
            if( !chainedAdded ) {
                chainedAdded = true;
                mngr.addListener(chained);
            }
        }
};

TEST_CASE( "Listener Added During Dispatch Test 10", "[manager][listener]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);

    RecordingListenerRef l2 = std::make_shared<RecordingListener>();
    std::shared_ptr<ChainingListener> l1 = std::make_shared<ChainingListener>(mngr, l2);
    REQUIRE( true == mngr.addListener(l1) );
    REQUIRE( 0 == l1->addedCount() );

    fakeV2->setDevices( make_devices({
            RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER"),
            RawDeviceDescriptor("682000001", "/dev/ttyACM1", "SEGGER") }) );
    const CycleResult r1 = runCycle(mngr);
    REQUIRE( 2 == r1.adapters.size() );
    REQUIRE( 2 == mngr.getListenerCount() );
    REQUIRE( 2 == l1->addedCount() );

    // each adapter reported once to the listener added during dispatch
    REQUIRE( 2 == l2->addedCount() );
    REQUIRE( l2->addedAt(0) != l2->addedAt(1) );
    REQUIRE( r1.adapters.count(l2->addedAt(0)->getInstanceId()) == 1 );
    REQUIRE( r1.adapters.count(l2->addedAt(1)->getInstanceId()) == 1 );

    fakeV2->setDevices( jau::darray<RawDeviceDescriptor>() );
    runCycle(mngr);
    REQUIRE( 2 == l1->removedCount() );
    REQUIRE( 2 == l2->removedCount() );
    REQUIRE( 2 == l2->addedCount() );
}

TEST_CASE( "Close Test 11", "[manager][close]" ) {
    AdapterManager& mngr = getManager();
    resetManager(mngr);

    fakeV2->setDevices( make_devices({ RawDeviceDescriptor("680123456", "/dev/ttyACM0", "SEGGER") }) );
    runCycle(mngr);
    REQUIRE( 1 == mngr.getAdapterCount() );

    mngr.close();
    REQUIRE( false == mngr.isRunning() );
    REQUIRE( 0 == mngr.getAdapterCount() );
    REQUIRE( false == mngr.triggerDiscovery() );

    // callback still invoked exactly once
    const CycleResult r = runCycle(mngr);
    REQUIRE( DiscoveryStatus::ENUMERATION_FAILURE == r.error.status );
    REQUIRE( 0 == r.adapters.size() );
}
