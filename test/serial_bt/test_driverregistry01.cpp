#include <iostream>
#include <cinttypes>
#include <cstring>

#include <catch2/catch_test_macros.hpp>

#include <serial_bt/SBTTypes.hpp>
#include <serial_bt/DriverBackend.hpp>

#include "sbt_test_drivers.hpp"

using namespace serial_bt;
using namespace serial_bt_test;

TEST_CASE( "Discovery Status Test 01", "[types][status]" ) {
    REQUIRE( "SUCCESS" == to_string(DiscoveryStatus::SUCCESS) );
    REQUIRE( "MISSING_INSTANCE_ID" == to_string(DiscoveryStatus::MISSING_INSTANCE_ID) );
    REQUIRE( "ENUMERATION_FAILURE" == to_string(DiscoveryStatus::ENUMERATION_FAILURE) );

    REQUIRE( false == isDeviceStatus(DiscoveryStatus::SUCCESS) );
    REQUIRE( true == isDeviceStatus(DiscoveryStatus::MISSING_INSTANCE_ID) );
    REQUIRE( true == isDeviceStatus(DiscoveryStatus::UNKNOWN_ADAPTER_VENDOR) );
    REQUIRE( true == isDeviceStatus(DiscoveryStatus::UNSUPPORTED_HARDWARE) );
    REQUIRE( true == isDeviceStatus(DiscoveryStatus::ADAPTER_CREATION_FAILED) );
    REQUIRE( false == isDeviceStatus(DiscoveryStatus::ENUMERATION_FAILURE) );
    REQUIRE( false == isDeviceStatus(DiscoveryStatus::NO_DRIVER) );

    const DiscoveryError none;
    REQUIRE( false == none.isError() );
    const DiscoveryError e(DiscoveryStatus::UNKNOWN_ADAPTER_VENDOR, "/dev/ttyUSB0", "unknown");
    REQUIRE( true == e.isError() );
    std::cout << e.toString() << std::endl;
}

TEST_CASE( "Driver Registry Test 01", "[driver][registry]" ) {
    DriverRegistry drivers;
    REQUIRE( 0 == drivers.getBackendCount() );
    REQUIRE( nullptr == drivers.getEnumerator() );
    REQUIRE( DriverGeneration::SD_API_V2 == drivers.getEnumeratorGeneration() );

    REQUIRE_THROWS_AS( drivers.registerBackend(nullptr), jau::IllegalArgumentException );

    FakeDriverBackendRef v2 = std::make_shared<FakeDriverBackend>(DriverGeneration::SD_API_V2);
    FakeDriverBackendRef v3 = std::make_shared<FakeDriverBackend>(DriverGeneration::SD_API_V3);
    drivers.registerBackend(v3);
    REQUIRE( 1 == drivers.getBackendCount() );
    REQUIRE( nullptr == drivers.getEnumerator() );
    REQUIRE( v3 == drivers.getBackend(DriverGeneration::SD_API_V3) );

    drivers.registerBackend(v2);
    REQUIRE( 2 == drivers.getBackendCount() );
    REQUIRE( v2 == drivers.getEnumerator() );
    std::cout << drivers.toString() << std::endl;

    drivers.setEnumeratorGeneration(DriverGeneration::SD_API_V3);
    REQUIRE( v3 == drivers.getEnumerator() );
    drivers.setEnumeratorGeneration(DriverGeneration::SD_API_V2);

    // replacing keeps one backend per generation
    FakeDriverBackendRef v2b = std::make_shared<FakeDriverBackend>(DriverGeneration::SD_API_V2);
    drivers.registerBackend(v2b);
    REQUIRE( 2 == drivers.getBackendCount() );
    REQUIRE( v2b == drivers.getEnumerator() );

    REQUIRE( v2b == drivers.removeBackend(DriverGeneration::SD_API_V2) );
    REQUIRE( nullptr == drivers.removeBackend(DriverGeneration::SD_API_V2) );
    REQUIRE( 1 == drivers.getBackendCount() );

    drivers.clear();
    REQUIRE( 0 == drivers.getBackendCount() );
}
