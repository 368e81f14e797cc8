#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "hc/core/types/SliceTransform.hpp"
#include "hc/core/types/Volume.hpp"

namespace hc {

// A loaded volume together with its own rotation/slice state
struct VolumeEntry {
    explicit VolumeEntry(std::shared_ptr<const Volume> v);

    std::shared_ptr<const Volume> volume;
    SliceTransform transform;
};

// Ordered volumes with a circular cursor.
// Invariant: 0 <= cursor() < size() whenever the collection is not empty.
class VolumeCollection
{
public:
    using iterator = std::vector<VolumeEntry>::iterator;
    using const_iterator = std::vector<VolumeEntry>::const_iterator;

    VolumeCollection() = default;
    explicit VolumeCollection(std::vector<VolumeEntry> entries);

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] std::size_t cursor() const { return cursor_; }

    // throws EmptyCollection
    VolumeEntry& current();
    [[nodiscard]] const VolumeEntry& current() const;

    // throws OutOfRange
    VolumeEntry& at(std::size_t i);
    [[nodiscard]] const VolumeEntry& at(std::size_t i) const;
    void setCursor(std::size_t i);

    // Move the cursor by one with wraparound; no-op for a single entry.
    // Throw EmptyCollection when empty.
    void advance();
    void retreat();

    // Throws EmptyCollection when empty, SingleElement when only one entry
    // is left (the collection is not modified) and OutOfRange for a bad
    // index. The cursor stays on the same entry when that entry survives.
    VolumeEntry remove(std::size_t i);

    // Entries are added without moving the cursor unless select is set, in
    // which case the cursor moves to the new entry
    void insert(std::size_t i, VolumeEntry entry, bool select = false);
    void append(VolumeEntry entry, bool select = false);
    void extend(std::vector<VolumeEntry> entries);
    void replace(std::size_t i, VolumeEntry entry);

    void clear();

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

private:
    void checkIndex(std::size_t i) const;

    std::vector<VolumeEntry> entries_;
    std::size_t cursor_{0};
};

}  // namespace hc
