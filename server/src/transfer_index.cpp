#include "dropdeck/server/transfer_index.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dropdeck/server/errors.hpp"

namespace dropdeck::server
{

    namespace
    {
        constexpr int kDocumentVersion = 1;
        constexpr auto kCorruptSuffix = ".corrupt";

        void move_aside(const std::filesystem::path &path)
        {
            auto target = path;
            target += kCorruptSuffix;
            std::error_code ec;
            std::filesystem::rename(path, target, ec);
            if (ec)
            {
                spdlog::error("Could not move corrupt index {} aside: {}", path.string(), ec.message());
            }
            else
            {
                spdlog::error("Corrupt transfer index moved to {}", target.string());
            }
        }

    } // namespace

    TransferIndex::TransferIndex(std::filesystem::path document_path, const AtomicWriter &writer,
                                 std::size_t capacity)
        : document_path_(std::move(document_path)), writer_(writer), capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    std::vector<TransferItem> TransferIndex::list(ItemFilter filter, std::optional<std::size_t> limit) const
    {
        std::vector<TransferItem> result;
        {
            std::lock_guard lock(mutex_);
            load_locked();
            std::copy_if(items_.begin(), items_.end(), std::back_inserter(result),
                         [filter](const TransferItem &item)
                         { return matches(filter, item); });
        }

        // Items are kept newest first; the stable sort only reorders a hand-edited document.
        std::stable_sort(result.begin(), result.end(), [](const TransferItem &lhs, const TransferItem &rhs)
                         { return lhs.timestamp > rhs.timestamp; });

        if (limit && *limit > 0 && result.size() > *limit)
        {
            result.resize(*limit);
        }
        return result;
    }

    TransferItem TransferIndex::append(TransferItem item)
    {
        std::lock_guard lock(mutex_);
        load_locked();

        if (!items_.empty() && item.timestamp < items_.front().timestamp)
        {
            item.timestamp = items_.front().timestamp;
        }

        auto updated = items_;
        updated.insert(updated.begin(), item);
        std::size_t evicted = 0;
        while (updated.size() > capacity_)
        {
            updated.pop_back();
            ++evicted;
        }

        persist_locked(updated);
        items_ = std::move(updated);
        if (evicted > 0)
        {
            spdlog::debug("Transfer index at capacity, evicted {} oldest item(s)", evicted);
        }

        notify_locked(TransferEvent::added(item));
        return item;
    }

    std::optional<TransferItem> TransferIndex::remove(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        load_locked();

        const auto it = std::find_if(items_.begin(), items_.end(), [&](const TransferItem &item)
                                     { return item.id == id; });
        if (it == items_.end())
        {
            return std::nullopt;
        }

        auto removed = *it;
        auto updated = items_;
        updated.erase(updated.begin() + (it - items_.begin()));

        persist_locked(updated);
        items_ = std::move(updated);

        notify_locked(TransferEvent::deleted(removed.id));
        return removed;
    }

    std::optional<TransferItem> TransferIndex::find(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = std::find_if(items_.begin(), items_.end(), [&](const TransferItem &item)
                                     { return item.id == id; });
        if (it == items_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::size_t TransferIndex::size() const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        return items_.size();
    }

    void TransferIndex::add_commit_hook(CommitHook hook)
    {
        std::lock_guard lock(mutex_);
        hooks_.push_back(std::move(hook));
    }

    void TransferIndex::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        items_.clear();

        std::error_code ec;
        if (std::filesystem::exists(document_path_, ec))
        {
            std::ifstream in(document_path_);
            if (!in.is_open())
            {
                throw TransferError(dropdeck::ErrorCode::IoError, "Cannot open " + document_path_.string());
            }
            try
            {
                nlohmann::json json;
                in >> json;
                items_ = json.at("items").get<std::vector<TransferItem>>();
            }
            catch (const std::exception &ex)
            {
                in.close();
                spdlog::error("Failed to parse transfer index {}: {}", document_path_.string(), ex.what());
                items_.clear();
                move_aside(document_path_);
            }

            if (items_.size() > capacity_)
            {
                items_.resize(capacity_);
            }
            spdlog::info("Loaded {} transfer item(s) from {}", items_.size(), document_path_.string());
        }
        loaded_ = true;
    }

    void TransferIndex::persist_locked(const std::vector<TransferItem> &items) const
    {
        std::filesystem::create_directories(document_path_.parent_path());
        nlohmann::json json = {
            {"version", kDocumentVersion},
            {"items", items},
        };
        writer_.write_json(document_path_, json);
    }

    void TransferIndex::notify_locked(const TransferEvent &event) const
    {
        for (const auto &hook : hooks_)
        {
            try
            {
                hook(event);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Transfer index commit hook failed: {}", ex.what());
            }
        }
    }

} // namespace dropdeck::server
