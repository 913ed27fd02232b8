#include "dropdeck/transfer_item.hpp"

#include <array>
#include <chrono>
#include <stdexcept>

namespace dropdeck
{

    namespace
    {

        constexpr std::string_view kPhotoMimePrefix = "image/";

        struct FilterMapping
        {
            ItemFilter filter;
            std::string_view label;
        };

        constexpr std::array<FilterMapping, 4> kFilterMappings{{
            {ItemFilter::All, "all"},
            {ItemFilter::Text, "text"},
            {ItemFilter::File, "file"},
            {ItemFilter::Photo, "photo"},
        }};

    } // namespace

    std::int64_t current_timestamp_ms()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string_view to_string(ItemType type) noexcept
    {
        return type == ItemType::File ? "file" : "text";
    }

    std::optional<ItemType> item_type_from_string(std::string_view value) noexcept
    {
        if (value == "text")
        {
            return ItemType::Text;
        }
        if (value == "file")
        {
            return ItemType::File;
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const FileInfo &file)
    {
        json = {
            {"name", file.name},
            {"size", file.size},
            {"mime", file.mime},
            {"url", file.url},
        };
        if (file.hash)
        {
            json["hash"] = *file.hash;
        }
    }

    void from_json(const nlohmann::json &json, FileInfo &file)
    {
        file.name = json.at("name").get<std::string>();
        file.size = json.value("size", 0ULL);
        file.mime = json.value("mime", std::string{});
        file.url = json.at("url").get<std::string>();
        if (auto it = json.find("hash"); it != json.end() && it->is_string())
        {
            file.hash = it->get<std::string>();
        }
        else
        {
            file.hash.reset();
        }
    }

    bool TransferItem::is_photo() const noexcept
    {
        return type == ItemType::File && file && file->mime.starts_with(kPhotoMimePrefix);
    }

    void to_json(nlohmann::json &json, const TransferItem &item)
    {
        json = {
            {"id", item.id},
            {"type", to_string(item.type)},
            {"timestamp", item.timestamp},
            {"sender", item.sender},
        };
        if (item.type == ItemType::Text)
        {
            json["content"] = item.content;
        }
        else if (item.file)
        {
            json["file"] = *item.file;
        }
    }

    void from_json(const nlohmann::json &json, TransferItem &item)
    {
        item.id = json.at("id").get<std::string>();
        const auto type_label = json.at("type").get<std::string>();
        const auto type = item_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown transfer item type: " + type_label);
        }
        item.type = *type;
        item.timestamp = json.value("timestamp", std::int64_t{0});
        item.sender = json.value("sender", std::string{});
        item.content.clear();
        item.file.reset();
        if (item.type == ItemType::Text)
        {
            item.content = json.value("content", std::string{});
        }
        else
        {
            item.file = json.at("file").get<FileInfo>();
        }
    }

    std::string_view to_string(ItemFilter filter) noexcept
    {
        for (const auto &mapping : kFilterMappings)
        {
            if (mapping.filter == filter)
            {
                return mapping.label;
            }
        }
        return "all";
    }

    std::optional<ItemFilter> item_filter_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kFilterMappings)
        {
            if (mapping.label == value)
            {
                return mapping.filter;
            }
        }
        return std::nullopt;
    }

    bool matches(ItemFilter filter, const TransferItem &item) noexcept
    {
        switch (filter)
        {
        case ItemFilter::All:
            return true;
        case ItemFilter::Text:
            return item.type == ItemType::Text;
        case ItemFilter::File:
            return item.type == ItemType::File;
        case ItemFilter::Photo:
            return item.is_photo();
        }
        return false;
    }

    std::string_view to_string(EventKind kind) noexcept
    {
        return kind == EventKind::Delete ? "delete" : "add";
    }

    TransferEvent TransferEvent::added(const TransferItem &item)
    {
        return TransferEvent{.kind = EventKind::Add, .item = item, .id = item.id};
    }

    TransferEvent TransferEvent::deleted(std::string id)
    {
        return TransferEvent{.kind = EventKind::Delete, .item = std::nullopt, .id = std::move(id)};
    }

    void to_json(nlohmann::json &json, const TransferEvent &event)
    {
        json = {{"type", to_string(event.kind)}};
        if (event.kind == EventKind::Add && event.item)
        {
            json["item"] = *event.item;
        }
        else
        {
            json["id"] = event.id;
        }
    }

    void from_json(const nlohmann::json &json, TransferEvent &event)
    {
        const auto type_label = json.at("type").get<std::string>();
        if (type_label == "add")
        {
            event.kind = EventKind::Add;
            event.item = json.at("item").get<TransferItem>();
            event.id = event.item->id;
        }
        else if (type_label == "delete")
        {
            event.kind = EventKind::Delete;
            event.item.reset();
            event.id = json.at("id").get<std::string>();
        }
        else
        {
            throw std::runtime_error("Unknown transfer event type: " + type_label);
        }
    }

} // namespace dropdeck
