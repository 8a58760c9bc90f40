#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// String ids for protocol objects. Ids come from a counter and are never
// reused for the lifetime of the table, even when the compositor recycles an
// object id or the allocator recycles a proxy address.
template <typename Handle>
class HandleIds {
public:
    explicit HandleIds(std::string prefix) : prefix_(std::move(prefix)) {}

    // Gives `handle` a fresh id, replacing any previous one.
    const std::string& assign(Handle* handle) {
        return ids_[handle] = std::format("{}#{}", prefix_, ++last_);
    }

    // Empty if the handle was never assigned or already released.
    std::string find(Handle* handle) const {
        auto it = ids_.find(handle);
        return it == ids_.end() ? std::string{} : it->second;
    }

    void release(Handle* handle) { ids_.erase(handle); }

    std::vector<Handle*> handles() const {
        std::vector<Handle*> out;
        out.reserve(ids_.size());
        for (const auto& [handle, id] : ids_) out.push_back(handle);
        return out;
    }

    size_t size() const { return ids_.size(); }

private:
    std::string prefix_;
    uint64_t last_ = 0;
    std::unordered_map<Handle*, std::string> ids_;
};
