#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mcphub::util
{

/**
 * Ordered set of release actions for resources acquired while building a connection.
 *
 * release_all() runs every recorded action exactly once, newest first. A releaser that
 * throws is logged and skipped; the remaining releasers still run. Calling release_all()
 * again is a no-op, and the destructor calls it.
 *
 * Actions acquired after release_all() has run are released immediately.
 */
class ResourceGroup
{
  public:
    using Releaser = std::function<void()>;

    ResourceGroup() = default;
    ~ResourceGroup();

    ResourceGroup(const ResourceGroup&) = delete;
    ResourceGroup& operator=(const ResourceGroup&) = delete;

    /// Record @p releaser under a diagnostic @p label
    void acquire(std::string label, Releaser releaser);

    /// Run all releasers in reverse acquisition order
    void release_all();

    bool released() const;
    std::size_t size() const;

  private:
    struct Entry
    {
        std::string label;
        Releaser release;
    };

    static void run_releaser(Entry& entry);

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    bool released_{false};
};

} // namespace mcphub::util
