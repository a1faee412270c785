#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkup::server
{

    // Table of per-session mutexes. Entries live only while someone holds or waits on them.
    class SessionLocks
    {
        struct Entry
        {
            std::mutex mutex;
            std::size_t users = 0;
        };

    public:
        class Guard
        {
        public:
            Guard(Guard &&other) noexcept;
            Guard &operator=(Guard &&other) = delete;
            Guard(const Guard &) = delete;
            Guard &operator=(const Guard &) = delete;
            ~Guard();

        private:
            friend class SessionLocks;
            Guard(SessionLocks *owner, std::string id, Entry *entry) noexcept;

            SessionLocks *owner_;
            std::string id_;
            Entry *entry_;
        };

        Guard acquire(const std::string &id);

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;

        void release(const std::string &id, Entry *entry);
    };

} // namespace chunkup::server
