// Groups consecutive work items sharing a connection identity so a single
// session can serve each run. Items are never reordered: [A, A, B, A]
// yields three runs.
#pragma once
#include "SftpTypes.hpp"
#include <optional>
#include <vector>

namespace sftpflow {

template <typename Item>
struct IdentityGroup {
    ConnectionIdentity identity;
    std::vector<Item*> items;
};

// identityOf(item) -> std::optional<ConnectionIdentity>. Items without an
// identity are handed to onRejected(item) and belong to no group. Such an
// item still separates its neighbours: [A, x, A] yields two runs.
template <typename Item, typename IdentityOf, typename OnRejected>
std::vector<IdentityGroup<Item>> groupByIdentity(std::vector<Item>& items,
                                                 IdentityOf identityOf,
                                                 OnRejected onRejected) {
    std::vector<IdentityGroup<Item>> groups;
    bool runOpen = false;
    for (Item& item : items) {
        std::optional<ConnectionIdentity> id = identityOf(item);
        if (!id) {
            onRejected(item);
            runOpen = false;
            continue;
        }
        if (!runOpen || groups.back().identity != *id) {
            groups.push_back(IdentityGroup<Item>{*id, {}});
            runOpen = true;
        }
        groups.back().items.push_back(&item);
    }
    return groups;
}

} // namespace sftpflow
