#include "dropdeck/server/broadcaster.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace dropdeck::server
{

    Broadcaster::SubscriptionId Broadcaster::subscribe(const std::shared_ptr<Subscriber> &subscriber)
    {
        std::lock_guard lock(mutex_);
        const auto id = next_id_++;
        subscribers_.emplace(id, subscriber);
        return id;
    }

    void Broadcaster::unsubscribe(SubscriptionId id)
    {
        std::lock_guard lock(mutex_);
        subscribers_.erase(id);
    }

    std::size_t Broadcaster::publish(const TransferEvent &event)
    {
        std::vector<std::shared_ptr<Subscriber>> targets;
        {
            std::lock_guard lock(mutex_);
            for (auto it = subscribers_.begin(); it != subscribers_.end();)
            {
                if (auto subscriber = it->second.lock())
                {
                    targets.push_back(std::move(subscriber));
                    ++it;
                }
                else
                {
                    it = subscribers_.erase(it);
                }
            }
        }

        std::size_t delivered = 0;
        for (const auto &subscriber : targets)
        {
            try
            {
                subscriber->deliver(event);
                ++delivered;
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Dropping {} event for one viewer: {}", to_string(event.kind), ex.what());
            }
        }
        spdlog::debug("Published {} event for {} to {} viewer(s)", to_string(event.kind), event.id, delivered);
        return delivered;
    }

    std::size_t Broadcaster::subscriber_count() const
    {
        std::lock_guard lock(mutex_);
        std::size_t count = 0;
        for (const auto &[id, weak] : subscribers_)
        {
            if (!weak.expired())
            {
                ++count;
            }
        }
        return count;
    }

} // namespace dropdeck::server
