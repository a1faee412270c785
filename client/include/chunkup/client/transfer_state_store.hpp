#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::client
{

    // Remembers the server session behind each unfinished local upload so a later run can resume it.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::string endpoint;
            std::filesystem::path local_path;
            std::string session_id;
            std::uint64_t file_size{};
            std::uint64_t chunk_size{};
            std::string hash_function;
        };

        TransferStateStore();
        explicit TransferStateStore(std::filesystem::path state_path);

        std::optional<Entry> find(const std::string &endpoint, const std::filesystem::path &local_path) const;

        void upsert(Entry entry);

        void remove(const std::string &endpoint, const std::filesystem::path &local_path);

        const std::filesystem::path &path() const noexcept { return state_path_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::const_iterator find_entry(const std::string &endpoint,
                                                      const std::filesystem::path &local_path) const;
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace chunkup::client
