#include "fleetsync/agent/outbox.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <map>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        std::int64_t to_unix_millis(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        bool write_all(int fd, const std::string &data)
        {
            std::size_t written = 0;
            while (written < data.size())
            {
                const auto result = ::write(fd, data.data() + written, data.size() - written);
                if (result < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return false;
                }
                written += static_cast<std::size_t>(result);
            }
            return true;
        }

    } // namespace

    void to_json(nlohmann::json &json, const PendingEvent &event)
    {
        json = {
            {"id", event.id},
            {"event", event.payload},
            {"timestamp_ms", to_unix_millis(event.created_at)},
            {"retries", event.retry_count},
        };
    }

    void from_json(const nlohmann::json &json, PendingEvent &event)
    {
        event.id = json.at("id").get<std::string>();
        event.payload = json.at("event");
        event.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(json.value("timestamp_ms", std::int64_t{})));
        event.retry_count = json.value("retries", 0);
    }

    Outbox::Outbox(std::filesystem::path store_path, std::string agent_id, OutboxSettings settings)
        : store_path_(std::move(store_path)), agent_id_(std::move(agent_id)), settings_(settings) {}

    std::filesystem::path Outbox::default_store_path(const std::filesystem::path &data_dir, const std::string &agent_id)
    {
        return data_dir / ("pending_events_" + agent_id + ".json");
    }

    void Outbox::append(nlohmann::json payload)
    {
        bool flush_now = false;
        {
            std::lock_guard lock(mutex_);
            buffer_.push_back(PendingEvent{
                .id = next_id(),
                .payload = std::move(payload),
                .created_at = std::chrono::system_clock::now(),
                .retry_count = 0,
            });
            flush_now = should_flush(Clock::now());
        }
        if (flush_now)
        {
            flush();
        }
    }

    bool Outbox::flush()
    {
        std::lock_guard file_lock(file_mutex_);
        std::vector<PendingEvent> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(buffer_);
            last_flush_ = Clock::now();
        }
        if (batch.empty())
        {
            return true;
        }

        auto entries = read_store();
        entries.insert(entries.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
        if (entries.size() > settings_.max_entries)
        {
            const auto excess = entries.size() - settings_.max_entries;
            spdlog::warn("Outbox over capacity, dropping {} oldest pending events", excess);
            entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(excess));
        }

        if (write_store(entries))
        {
            spdlog::debug("Outbox flushed, {} pending events on disk", entries.size());
            return true;
        }

        // Put the unsaved batch back ahead of anything appended meanwhile.
        const auto kept = std::min(batch.size(), entries.size());
        std::vector<PendingEvent> restored(std::make_move_iterator(entries.end() - static_cast<std::ptrdiff_t>(kept)),
                                           std::make_move_iterator(entries.end()));
        std::lock_guard lock(mutex_);
        restored.insert(restored.end(), std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.end()));
        buffer_ = std::move(restored);
        return false;
    }

    Outbox::ReplayResult Outbox::replay(const SendFunction &send)
    {
        ReplayResult result;
        flush();

        std::vector<PendingEvent> snapshot;
        {
            std::lock_guard file_lock(file_mutex_);
            snapshot = read_store();
        }
        if (snapshot.empty())
        {
            return result;
        }
        spdlog::info("Replaying {} pending events", snapshot.size());

        std::map<std::string, bool> outcomes;
        for (const auto &entry : snapshot)
        {
            ++result.attempted;
            bool delivered = false;
            try
            {
                delivered = send(entry.payload);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Replay of pending event {} failed: {}", entry.id, ex.what());
            }
            outcomes[entry.id] = delivered;
        }

        std::lock_guard file_lock(file_mutex_);
        auto current = read_store();
        std::vector<PendingEvent> remaining;
        remaining.reserve(current.size());
        for (auto &entry : current)
        {
            auto it = outcomes.find(entry.id);
            if (it == outcomes.end())
            {
                remaining.push_back(std::move(entry));
                continue;
            }
            if (it->second)
            {
                ++result.delivered;
                continue;
            }
            ++result.failed;
            ++entry.retry_count;
            if (entry.retry_count >= settings_.max_retries)
            {
                ++result.dropped;
                const auto type = entry.payload.is_object() ? entry.payload.value("type", std::string{"unknown"})
                                                            : std::string{"unknown"};
                spdlog::error("Dropping pending event {} ({}) after {} failed delivery attempts", entry.id, type,
                              entry.retry_count);
                continue;
            }
            remaining.push_back(std::move(entry));
        }
        if (!write_store(remaining))
        {
            spdlog::error("Could not persist outbox after replay; delivered events may be sent again");
        }
        spdlog::info("Replay finished: {} delivered, {} failed, {} dropped", result.delivered, result.failed,
                     result.dropped);
        return result;
    }

    std::vector<PendingEvent> Outbox::load() const
    {
        std::lock_guard file_lock(file_mutex_);
        return read_store();
    }

    std::size_t Outbox::buffered_count() const
    {
        std::lock_guard lock(mutex_);
        return buffer_.size();
    }

    std::size_t Outbox::pending_count() const
    {
        return load().size() + buffered_count();
    }

    bool Outbox::should_flush(Clock::time_point now) const
    {
        if (buffer_.size() >= settings_.flush_batch)
        {
            return true;
        }
        if (!last_flush_)
        {
            return true;
        }
        const auto since = now - *last_flush_;
        if (since > settings_.max_flush_interval)
        {
            return true;
        }
        return !buffer_.empty() && since > settings_.flush_after;
    }

    std::string Outbox::next_id()
    {
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
        if (nanos <= last_id_nanos_)
        {
            nanos = last_id_nanos_ + 1;
        }
        last_id_nanos_ = nanos;
        return agent_id_ + "_" + std::to_string(nanos);
    }

    std::vector<PendingEvent> Outbox::read_store() const
    {
        const int fd = ::open(store_path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            const int error = errno;
            if (error == ENOENT)
            {
                return {};
            }
            if (error == EMFILE || error == ENFILE)
            {
                spdlog::warn("Too many open files while loading {}, continuing with an empty outbox",
                             store_path_.string());
                return {};
            }
            spdlog::warn("Cannot open outbox {}: {}", store_path_.string(), std::strerror(error));
            return {};
        }

        std::string text;
        char chunk[8192];
        for (;;)
        {
            const auto count = ::read(fd, chunk, sizeof(chunk));
            if (count < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                spdlog::warn("Failed reading outbox {}: {}", store_path_.string(), std::strerror(errno));
                ::close(fd);
                return {};
            }
            if (count == 0)
            {
                break;
            }
            text.append(chunk, static_cast<std::size_t>(count));
        }
        ::close(fd);

        if (text.empty())
        {
            return {};
        }
        const auto json = nlohmann::json::parse(text, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            spdlog::warn("Outbox {} is corrupt, starting with an empty list", store_path_.string());
            return {};
        }

        std::vector<PendingEvent> entries;
        entries.reserve(json.size());
        for (const auto &item : json)
        {
            try
            {
                entries.push_back(item.get<PendingEvent>());
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping malformed outbox entry: {}", ex.what());
            }
        }
        return entries;
    }

    bool Outbox::write_store(const std::vector<PendingEvent> &entries) const
    {
        std::error_code ec;
        const auto dir = store_path_.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                spdlog::error("Cannot create outbox directory {}: {}", dir.string(), ec.message());
                return false;
            }
        }

        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries)
        {
            json.push_back(nlohmann::json(entry));
        }
        const auto text = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        auto temp_path = store_path_;
        temp_path += ".tmp";
        const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            spdlog::error("Cannot write outbox {}: {}", temp_path.string(), std::strerror(errno));
            return false;
        }
        const bool written = write_all(fd, text) && ::fsync(fd) == 0;
        const int write_errno = errno;
        ::close(fd);
        if (!written)
        {
            spdlog::error("Failed writing outbox {}: {}", temp_path.string(), std::strerror(write_errno));
            std::filesystem::remove(temp_path, ec);
            return false;
        }

        std::filesystem::rename(temp_path, store_path_, ec);
        if (ec)
        {
            spdlog::error("Failed replacing outbox {}: {}", store_path_.string(), ec.message());
            std::filesystem::remove(temp_path, ec);
            return false;
        }
        return true;
    }

} // namespace fleetsync::agent
