#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dropdeck/server/atomic_writer.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::server
{

    inline constexpr std::size_t kTransferIndexCapacity = 1000;

    /**
     * Ordered, capacity-bounded collection of transfer items persisted as a single JSON document.
     *
     * The document is loaded lazily on first access and rewritten wholesale through the
     * AtomicWriter on every mutation. Mutations are serialized by a mutex, so read-modify-write
     * is race free inside one process; two processes sharing the same root would still race and
     * the later writer wins.
     *
     * Commit hooks run after the new document has been renamed into place, in mutation order,
     * while the index lock is held. They must not call back into the index and must not block.
     */
    class TransferIndex
    {
    public:
        using CommitHook = std::function<void(const TransferEvent &)>;

        TransferIndex(std::filesystem::path document_path, const AtomicWriter &writer,
                      std::size_t capacity = kTransferIndexCapacity);

        // Newest first. A limit of std::nullopt or 0 returns every matching item.
        std::vector<TransferItem> list(ItemFilter filter = ItemFilter::All,
                                       std::optional<std::size_t> limit = std::nullopt) const;

        // Inserts at the head and returns the stored item, whose timestamp may have been raised
        // to keep insertion order and timestamp order aligned. Evicts the oldest items beyond
        // capacity.
        TransferItem append(TransferItem item);

        // Idempotent: an unknown id leaves the document untouched and returns std::nullopt.
        std::optional<TransferItem> remove(const std::string &id);

        std::optional<TransferItem> find(const std::string &id) const;

        std::size_t size() const;
        std::size_t capacity() const noexcept { return capacity_; }

        void add_commit_hook(CommitHook hook);

    private:
        void load_locked() const;
        void persist_locked(const std::vector<TransferItem> &items) const;
        void notify_locked(const TransferEvent &event) const;

        std::filesystem::path document_path_;
        const AtomicWriter &writer_;
        std::size_t capacity_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::vector<TransferItem> items_; // newest first
        std::vector<CommitHook> hooks_;
    };

} // namespace dropdeck::server
