#include "chunkup/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkup::client
{

    TransferStateStore::TransferStateStore() : TransferStateStore(default_state_path()) {}

    TransferStateStore::TransferStateStore(std::filesystem::path state_path) : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find(const std::string &endpoint,
                                                                      const std::filesystem::path &local_path) const
    {
        auto it = find_entry(endpoint, normalize_path(local_path));
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void TransferStateStore::upsert(Entry entry)
    {
        entry.local_path = normalize_path(entry.local_path);
        auto it = find_entry(entry.endpoint, entry.local_path);
        if (it == entries_.end())
        {
            entries_.push_back(std::move(entry));
        }
        else
        {
            entries_[static_cast<std::size_t>(it - entries_.begin())] = std::move(entry);
        }
        save();
    }

    void TransferStateStore::remove(const std::string &endpoint, const std::filesystem::path &local_path)
    {
        auto it = find_entry(endpoint, normalize_path(local_path));
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "ChunkUp" / "transfers.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkup" / "transfers.json";
        }
        return std::filesystem::path(".chunkup") / "transfers.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open transfer state " + state_path_.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Malformed transfer state " + state_path_.string() + ": " + ex.what());
        }
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.endpoint = item.value("endpoint", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.session_id = item.value("session_id", std::string{});
            entry.file_size = item.value("file_size", 0ULL);
            entry.chunk_size = item.value("chunk_size", 0ULL);
            entry.hash_function = item.value("hash_function", std::string{});
            if (!entry.endpoint.empty() && !entry.session_id.empty() && entry.chunk_size > 0)
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"endpoint", entry.endpoint},
                            {"local", entry.local_path.generic_string()},
                            {"session_id", entry.session_id},
                            {"file_size", entry.file_size},
                            {"chunk_size", entry.chunk_size},
                            {"hash_function", entry.hash_function}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Failed to write transfer state " + state_path_.string());
        }
        out << json.dump(2);
    }

    std::vector<TransferStateStore::Entry>::const_iterator TransferStateStore::find_entry(
        const std::string &endpoint, const std::filesystem::path &local_path) const
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.endpoint == endpoint && entry.local_path == local_path; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace chunkup::client
