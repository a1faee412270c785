#include "chunkup/server/session_locks.hpp"

#include <utility>

namespace chunkup::server
{

    SessionLocks::Guard::Guard(SessionLocks *owner, std::string id, Entry *entry) noexcept
        : owner_(owner), id_(std::move(id)), entry_(entry) {}

    SessionLocks::Guard::Guard(Guard &&other) noexcept
        : owner_(other.owner_), id_(std::move(other.id_)), entry_(other.entry_)
    {
        other.owner_ = nullptr;
        other.entry_ = nullptr;
    }

    SessionLocks::Guard::~Guard()
    {
        if (owner_ && entry_)
        {
            entry_->mutex.unlock();
            owner_->release(id_, entry_);
        }
    }

    SessionLocks::Guard SessionLocks::acquire(const std::string &id)
    {
        Entry *entry = nullptr;
        {
            std::lock_guard lock(mutex_);
            auto &slot = entries_[id];
            if (!slot)
            {
                slot = std::make_unique<Entry>();
            }
            ++slot->users;
            entry = slot.get();
        }
        entry->mutex.lock();
        return Guard(this, id, entry);
    }

    std::size_t SessionLocks::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void SessionLocks::release(const std::string &id, Entry *entry)
    {
        std::lock_guard lock(mutex_);
        if (--entry->users == 0)
        {
            entries_.erase(id);
        }
    }

} // namespace chunkup::server
