#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace unistore::storage::model {

enum class ItemKind { File, Folder };

std::string_view to_string(ItemKind kind);

struct Item {
    std::string name;
    ItemKind kind{ItemKind::File};

    Item() = default;
    Item(std::string name, ItemKind kind);
    virtual ~Item() = default;

    [[nodiscard]] bool isFolder() const { return kind == ItemKind::Folder; }
};

// Listing entry of an ID-addressed backend
struct DriveItem : Item {
    std::string id;
    std::string parent_id;

    DriveItem() = default;
    DriveItem(std::string name, ItemKind kind, std::string id, std::string parentId);
};

using ItemList = std::vector<std::shared_ptr<Item>>;

std::string to_string(const Item& item);
std::string to_string(const ItemList& items);

}
