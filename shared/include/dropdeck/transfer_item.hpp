/**
 * DropDeck - Transfer index records and the events pushed to viewers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dropdeck
{

    // Milliseconds since the Unix epoch, the unit of every timestamp in this project.
    std::int64_t current_timestamp_ms();

    enum class ItemType : std::uint8_t
    {
        Text,
        File
    };

    std::string_view to_string(ItemType type) noexcept;
    std::optional<ItemType> item_type_from_string(std::string_view value) noexcept;

    struct FileInfo
    {
        std::string name;
        std::uint64_t size{};
        std::string mime;
        std::string url;
        std::optional<std::string> hash{};

        bool operator==(const FileInfo &) const = default;
    };

    void to_json(nlohmann::json &json, const FileInfo &file);
    void from_json(const nlohmann::json &json, FileInfo &file);

    struct TransferItem
    {
        std::string id;
        ItemType type{ItemType::Text};
        std::string content{};          // text items only
        std::optional<FileInfo> file{}; // file items only
        std::int64_t timestamp{};       // milliseconds since the Unix epoch
        std::string sender;

        bool is_photo() const noexcept;

        bool operator==(const TransferItem &) const = default;
    };

    void to_json(nlohmann::json &json, const TransferItem &item);
    void from_json(const nlohmann::json &json, TransferItem &item);

    enum class ItemFilter : std::uint8_t
    {
        All,
        Text,
        File,
        Photo
    };

    std::string_view to_string(ItemFilter filter) noexcept;
    std::optional<ItemFilter> item_filter_from_string(std::string_view value) noexcept;

    bool matches(ItemFilter filter, const TransferItem &item) noexcept;

    enum class EventKind : std::uint8_t
    {
        Add,
        Delete
    };

    std::string_view to_string(EventKind kind) noexcept;

    struct TransferEvent
    {
        EventKind kind{EventKind::Add};
        std::optional<TransferItem> item{}; // set for Add
        std::string id;                     // id of the added or deleted item

        static TransferEvent added(const TransferItem &item);
        static TransferEvent deleted(std::string id);
    };

    void to_json(nlohmann::json &json, const TransferEvent &event);
    void from_json(const nlohmann::json &json, TransferEvent &event);

} // namespace dropdeck
