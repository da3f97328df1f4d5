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

#ifndef SBT_ADAPTER_REGISTRY_HPP_
#define SBT_ADAPTER_REGISTRY_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <map>

#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>

#include "SBTTypes.hpp"
#include "DriverBackend.hpp"
#include "AdapterClassifier.hpp"
#include "SerialAdapter.hpp"
#include "LifecycleBroadcaster.hpp"

namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    /**
     * Immutable snapshot of all live SerialAdapter, keyed by their instance id.
     */
    typedef std::map<std::string, SerialAdapterRef> AdapterMap;

    /**
     * Result of one AdapterRegistry::reconcile() pass.
     */
    struct ReconcileResult {
        /** Newly created adapter, in enumeration order. */
        jau::darray<SerialAdapterRef> added;
        /** Adapter no longer enumerated, removed from the registry. */
        jau::darray<SerialAdapterRef> removed;
        /** Per device errors, devices have been skipped. */
        jau::darray<DiscoveryError> errors;

        bool hasChanges() const noexcept { return added.size() > 0 || removed.size() > 0; }

        std::string toString() const noexcept;
    };

    /**
     * Authoritative mapping of device instance id to its live SerialAdapter.
     * <p>
     * The mapping is mutated by reconcile() only, passes are serialized.
     * Each pass replaces the copy-on-write storage once,
     * hence readers always observe a consistent snapshot.
     * </p>
     * <p>
     * Invariant: Exactly one live SerialAdapter exists per device instance id.
     * </p>
     */
    class AdapterRegistry {
        public:
            typedef jau::nsize_t size_type;

        private:
            typedef jau::cow_darray<SerialAdapterRef, size_type> adapters_t;

            const DriverRegistry& drivers;
            LifecycleBroadcaster& broadcaster;
            const HostPlatform platform;

            adapters_t adapters;

            SerialAdapterRef createAdapter(const AdapterClassifier::ClassificationResult& c, const RawDeviceDescriptor& d,
                                           DiscoveryError& error) noexcept;

        public:
            /**
             * @param drivers_ driver backends used to create adapter objects, shall outlive this instance
             * @param broadcaster_ attached to all added and detached from all removed adapter, shall outlive this instance
             * @param platform_ host platform used for AdapterClassifier::getPlatformAdvisory()
             */
            AdapterRegistry(const DriverRegistry& drivers_, LifecycleBroadcaster& broadcaster_,
                            const HostPlatform platform_=currentHostPlatform()) noexcept;

            AdapterRegistry(const AdapterRegistry&) = delete;
            void operator=(const AdapterRegistry&) = delete;

            /**
             * Reconciles the registry with the given freshly enumerated devices.
             * <p>
             * - Devices with a known instance id survive and are not re-created.
             * - Unknown devices are classified, created, attached to the LifecycleBroadcaster and added.
             * - Devices failing classification or creation are skipped and reported in ReconcileResult::errors.
             * - Known adapter missing in the given devices are detached from the LifecycleBroadcaster and removed.
             * </p>
             * <p>
             * Reconciling the same devices twice yields no changes on the second pass.
             * </p>
             */
            ReconcileResult reconcile(const jau::darray<RawDeviceDescriptor>& devices) noexcept;

            /** Returns an immutable snapshot of the current mapping. */
            AdapterMap getAdapterMap() const noexcept;

            /** Returns a copy of the current adapter list. */
            jau::darray<SerialAdapterRef> getAdapters() const noexcept { return *adapters.snapshot(); }

            /** Returns the adapter with the given instance id or nullptr if not present. */
            SerialAdapterRef getAdapter(const std::string& instanceId) const noexcept;

            size_type getAdapterCount() const noexcept { return adapters.size(); }

            /**
             * Removes all adapter and detaches them from the LifecycleBroadcaster.
             * @return the removed adapter
             */
            jau::darray<SerialAdapterRef> clear() noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace serial_bt

#endif /* SBT_ADAPTER_REGISTRY_HPP_ */
