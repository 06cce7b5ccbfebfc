#include "mcphub/util/resource_group.hpp"

#include "mcphub/util/log.hpp"

#include <exception>
#include <utility>

namespace mcphub::util
{

ResourceGroup::~ResourceGroup()
{
    release_all();
}

void ResourceGroup::acquire(std::string label, Releaser releaser)
{
    Entry entry{std::move(label), std::move(releaser)};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!released_)
        {
            entries_.push_back(std::move(entry));
            return;
        }
    }
    log::warn("Resource '" + entry.label + "' acquired after release; releasing now");
    run_releaser(entry);
}

void ResourceGroup::release_all()
{
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (released_)
            return;
        released_ = true;
        entries.swap(entries_);
    }

    for (auto it = entries.rbegin(); it != entries.rend(); ++it)
        run_releaser(*it);
}

bool ResourceGroup::released() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

std::size_t ResourceGroup::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResourceGroup::run_releaser(Entry& entry)
{
    if (!entry.release)
        return;
    try
    {
        entry.release();
        log::debug("Released " + entry.label);
    }
    catch (const std::exception& e)
    {
        log::warn("Error releasing " + entry.label + ": " + e.what());
    }
    catch (...)
    {
        log::warn("Error releasing " + entry.label + ": unknown exception");
    }
}

} // namespace mcphub::util
