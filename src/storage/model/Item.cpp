#include "storage/model/Item.hpp"

#include <utility>

namespace unistore::storage::model {

std::string_view to_string(const ItemKind kind) {
    return kind == ItemKind::Folder ? "Folder" : "File";
}

Item::Item(std::string name, const ItemKind kind)
    : name(std::move(name)), kind(kind) {}

DriveItem::DriveItem(std::string name, const ItemKind kind, std::string id, std::string parentId)
    : Item(std::move(name), kind), id(std::move(id)), parent_id(std::move(parentId)) {}

std::string to_string(const Item& item) {
    return std::string(to_string(item.kind)) + ": " + item.name;
}

std::string to_string(const ItemList& items) {
    std::string out;
    for (const auto& item : items) {
        if (!item) continue;
        out += to_string(*item);
        out += '\n';
    }
    return out;
}

}
