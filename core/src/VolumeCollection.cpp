#include "hc/core/types/VolumeCollection.hpp"

#include <iterator>
#include <string>

#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace hc {

static std::shared_ptr<const Volume> requireVolume(std::shared_ptr<const Volume> v)
{
    if (!v) {
        throw Error("Volume entry needs a volume");
    }
    return v;
}

VolumeEntry::VolumeEntry(std::shared_ptr<const Volume> v)
    : volume(requireVolume(std::move(v))), transform(*volume)
{
}

VolumeCollection::VolumeCollection(std::vector<VolumeEntry> entries)
    : entries_(std::move(entries))
{
}

void VolumeCollection::checkIndex(std::size_t i) const
{
    if (i >= entries_.size()) {
        throw OutOfRange("Volume index " + std::to_string(i) + " outside [0, " +
                         std::to_string(entries_.size()) + ")");
    }
}

VolumeEntry& VolumeCollection::current()
{
    if (entries_.empty()) {
        throw EmptyCollection("get current volume");
    }
    return entries_[cursor_];
}

const VolumeEntry& VolumeCollection::current() const
{
    if (entries_.empty()) {
        throw EmptyCollection("get current volume");
    }
    return entries_[cursor_];
}

VolumeEntry& VolumeCollection::at(std::size_t i)
{
    checkIndex(i);
    return entries_[i];
}

const VolumeEntry& VolumeCollection::at(std::size_t i) const
{
    checkIndex(i);
    return entries_[i];
}

void VolumeCollection::setCursor(std::size_t i)
{
    checkIndex(i);
    cursor_ = i;
}

void VolumeCollection::advance()
{
    if (entries_.empty()) {
        throw EmptyCollection("advance");
    }
    if (entries_.size() == 1) {
        Logger()->debug("advance() on a single volume does nothing");
        cursor_ = 0;
        return;
    }
    cursor_ = (cursor_ + 1) % entries_.size();
}

void VolumeCollection::retreat()
{
    if (entries_.empty()) {
        throw EmptyCollection("retreat");
    }
    if (entries_.size() == 1) {
        Logger()->debug("retreat() on a single volume does nothing");
        cursor_ = 0;
        return;
    }
    cursor_ = (cursor_ + entries_.size() - 1) % entries_.size();
}

VolumeEntry VolumeCollection::remove(std::size_t i)
{
    if (entries_.empty()) {
        throw EmptyCollection("remove");
    }
    if (entries_.size() == 1) {
        throw SingleElement();
    }
    checkIndex(i);

    auto it = std::next(entries_.begin(), static_cast<std::ptrdiff_t>(i));
    VolumeEntry removed = std::move(*it);
    entries_.erase(it);

    if (i < cursor_) {
        cursor_--;
    } else if (cursor_ >= entries_.size()) {
        cursor_ = entries_.size() - 1;
    }
    return removed;
}

void VolumeCollection::insert(std::size_t i, VolumeEntry entry, bool select)
{
    if (i > entries_.size()) {
        throw OutOfRange("Insert position " + std::to_string(i) + " outside [0, " +
                         std::to_string(entries_.size()) + "]");
    }
    entries_.insert(std::next(entries_.begin(), static_cast<std::ptrdiff_t>(i)), std::move(entry));
    if (select) {
        cursor_ = i;
    }
}

void VolumeCollection::append(VolumeEntry entry, bool select)
{
    entries_.push_back(std::move(entry));
    if (select) {
        cursor_ = entries_.size() - 1;
    }
}

void VolumeCollection::extend(std::vector<VolumeEntry> entries)
{
    entries_.insert(entries_.end(),
                    std::make_move_iterator(entries.begin()),
                    std::make_move_iterator(entries.end()));
}

void VolumeCollection::replace(std::size_t i, VolumeEntry entry)
{
    checkIndex(i);
    entries_[i] = std::move(entry);
}

void VolumeCollection::clear()
{
    entries_.clear();
    cursor_ = 0;
}

}  // namespace hc
