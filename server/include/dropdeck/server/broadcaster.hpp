#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "dropdeck/transfer_item.hpp"

namespace dropdeck::server
{

    // A connected viewer. deliver() must only enqueue; it is called from the publishing thread.
    class Subscriber
    {
    public:
        virtual ~Subscriber() = default;

        virtual void deliver(const TransferEvent &event) = 0;
    };

    /**
     * Fire-and-forget fan-out of index mutations to every subscribed viewer. Subscribers are held
     * weakly; a viewer that has gone away is pruned on the next publish. There is no replay, a
     * viewer that was not subscribed when an event was published misses it.
     */
    class Broadcaster
    {
    public:
        using SubscriptionId = std::uint64_t;

        SubscriptionId subscribe(const std::shared_ptr<Subscriber> &subscriber);
        void unsubscribe(SubscriptionId id);

        // Returns the number of subscribers the event was handed to.
        std::size_t publish(const TransferEvent &event);

        std::size_t subscriber_count() const;

    private:
        mutable std::mutex mutex_;
        SubscriptionId next_id_{1};
        std::map<SubscriptionId, std::weak_ptr<Subscriber>> subscribers_;
    };

} // namespace dropdeck::server
