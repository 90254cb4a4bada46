/**
 * fleetsync - Durable store for outbound messages that could not be sent.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fleetsync::agent
{

    struct PendingEvent
    {
        std::string id;
        nlohmann::json payload;
        std::chrono::system_clock::time_point created_at{};
        int retry_count{};
    };

    void to_json(nlohmann::json &json, const PendingEvent &event);
    void from_json(const nlohmann::json &json, PendingEvent &event);

    struct OutboxSettings
    {
        std::size_t flush_batch{10};
        std::chrono::milliseconds flush_after{std::chrono::seconds{5}};
        std::chrono::milliseconds max_flush_interval{std::chrono::seconds{30}};
        std::size_t max_entries{1000};
        int max_retries{3};
    };

    class Outbox
    {
    public:
        using SendFunction = std::function<bool(const nlohmann::json &)>;

        struct ReplayResult
        {
            std::size_t attempted{};
            std::size_t delivered{};
            std::size_t failed{};
            std::size_t dropped{};
        };

        Outbox(std::filesystem::path store_path, std::string agent_id, OutboxSettings settings = {});

        static std::filesystem::path default_store_path(const std::filesystem::path &data_dir, const std::string &agent_id);

        void append(nlohmann::json payload);

        // Moves the in-memory buffer to disk. Returns false if the store could not be written;
        // the batch then stays buffered.
        bool flush();

        // Re-sends stored entries oldest first. Delivered entries are deleted, failed ones
        // have their retry count persisted and are dropped once it reaches max_retries.
        ReplayResult replay(const SendFunction &send);

        std::vector<PendingEvent> load() const;

        std::size_t buffered_count() const;
        std::size_t pending_count() const;

        const std::filesystem::path &store_path() const noexcept { return store_path_; }

    private:
        using Clock = std::chrono::steady_clock;

        bool should_flush(Clock::time_point now) const;
        std::string next_id();
        std::vector<PendingEvent> read_store() const;
        bool write_store(const std::vector<PendingEvent> &entries) const;

        std::filesystem::path store_path_;
        std::string agent_id_;
        OutboxSettings settings_;

        // Lock order: file_mutex_ before mutex_, never the reverse.
        mutable std::mutex mutex_;
        mutable std::mutex file_mutex_;
        std::vector<PendingEvent> buffer_;
        std::optional<Clock::time_point> last_flush_;
        std::int64_t last_id_nanos_{};
    };

} // namespace fleetsync::agent
