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

#ifndef SBT_LIFECYCLE_BROADCASTER_HPP_
#define SBT_LIFECYCLE_BROADCASTER_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <unordered_map>

#include <jau/ordered_atomic.hpp>

#include "SerialAdapter.hpp"

namespace serial_bt {

    /** \addtogroup SBTUserAPI
     *
     *  @{
     */

    /**
     * Forwards the AdapterStateListener events of all attached SerialAdapter
     * to one sink AdapterStateListener, i.e. the AdapterManager's public event stream.
     * <p>
     * Each attached adapter receives its own forwarding listener.
     * Once detached, the forwarder is removed from the adapter and disabled,
     * hence the adapter's events never reach the sink afterwards.
     * </p>
     */
    class LifecycleBroadcaster {
        public:
            typedef jau::nsize_t size_type;

        private:
            class Forwarder : public AdapterStateListener {
                private:
                    AdapterStateListener& sink;
                    std::weak_ptr<SerialAdapter> wbr_adapter;
                    /** Held across the attached check and the forward, taken by disable(). */
                    std::recursive_mutex mtx_forward;
                    jau::sc_atomic_bool attached;

                public:
                    Forwarder(AdapterStateListener& sink_, const SerialAdapterRef& adapter) noexcept
                    : sink(sink_), wbr_adapter(adapter), attached(true) {}

                    void adapterOpened(const SerialAdapterRef& adapter) override;
                    void adapterClosed(const SerialAdapterRef& adapter) override;

                    SerialAdapterRef getAdapter() const noexcept { return wbr_adapter.lock(); }
                    /**
                     * Disables forwarding.
                     * <p>
                     * Waits for a forward in flight on another thread, hence no event is forwarded after return.
                     * </p>
                     */
                    void disable() noexcept;
                    bool isAttached() const noexcept { return attached; }

                    std::string toString() const noexcept override;
            };
            typedef std::shared_ptr<Forwarder> ForwarderRef;

            AdapterStateListener& sink;

            mutable std::mutex mtx_forwarder;
            std::unordered_map<std::string, ForwarderRef> forwarders;

            static void detachImpl(const ForwarderRef& f, const SerialAdapterRef& adapter) noexcept;

        public:
            /**
             * @param sink_ receiver of all forwarded events, shall outlive this instance
             */
            explicit LifecycleBroadcaster(AdapterStateListener& sink_) noexcept;

            LifecycleBroadcaster(const LifecycleBroadcaster&) = delete;
            void operator=(const LifecycleBroadcaster&) = delete;

            ~LifecycleBroadcaster() noexcept;

            /**
             * Attaches a forwarder to the given adapter, keyed by its instance id.
             * @return true if newly attached, false if null or already attached
             */
            bool attach(const SerialAdapterRef& adapter) noexcept;

            /**
             * Detaches the forwarder from the given adapter.
             * @return true if detached, false if null or not attached
             */
            bool detach(const SerialAdapterRef& adapter) noexcept;

            /**
             * Detaches all forwarders.
             * @return number of detached forwarders
             */
            size_type detachAll() noexcept;

            bool isAttached(const std::string& instanceId) const noexcept;

            size_type getAttachedCount() const noexcept;
    };

    /**@}*/

} // namespace serial_bt

#endif /* SBT_LIFECYCLE_BROADCASTER_HPP_ */
