#include "fleetsync/agent/scheduler.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    struct Scheduler::Entry
    {
        Entry(asio::io_context &io_context, std::string name, std::chrono::milliseconds every, Task work)
            : key(std::move(name)),
              strand(asio::make_strand(io_context)),
              timer(strand),
              interval(every),
              task(std::move(work)) {}

        std::string key;
        asio::strand<asio::io_context::executor_type> strand;
        asio::steady_timer timer;
        std::chrono::milliseconds interval;
        Task task;
        std::atomic<bool> cancelled{false};
    };

    Scheduler::Scheduler(asio::io_context &io_context)
        : io_context_(io_context) {}

    Scheduler::~Scheduler()
    {
        cancel_all();
    }

    void Scheduler::schedule_periodic(const std::string &key, std::chrono::milliseconds interval, Task task)
    {
        auto entry = std::make_shared<Entry>(io_context_, key, interval, std::move(task));
        std::shared_ptr<Entry> replaced;
        {
            std::lock_guard lock(mutex_);
            auto &slot = entries_[key];
            replaced = std::move(slot);
            slot = entry;
        }
        if (replaced)
        {
            disarm(replaced);
            spdlog::debug("Replaced periodic task {}", key);
        }
        asio::post(entry->strand, [entry]
                   { arm(entry); });
    }

    bool Scheduler::cancel(const std::string &key)
    {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end())
            {
                return false;
            }
            entry = std::move(it->second);
            entries_.erase(it);
        }
        disarm(entry);
        spdlog::debug("Cancelled periodic task {}", key);
        return true;
    }

    bool Scheduler::contains(const std::string &key) const
    {
        std::lock_guard lock(mutex_);
        return entries_.find(key) != entries_.end();
    }

    std::size_t Scheduler::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::vector<std::string> Scheduler::keys() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto &[key, entry] : entries_)
        {
            result.push_back(key);
        }
        return result;
    }

    void Scheduler::cancel_all()
    {
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
        {
            std::lock_guard lock(mutex_);
            entries.swap(entries_);
        }
        for (auto &[key, entry] : entries)
        {
            disarm(entry);
        }
    }

    // Runs on the entry's strand.
    void Scheduler::arm(const std::shared_ptr<Entry> &entry)
    {
        if (entry->cancelled.load())
        {
            return;
        }
        entry->timer.expires_after(entry->interval);
        entry->timer.async_wait([entry](const std::error_code &ec)
                                {
                                    if (ec || entry->cancelled.load())
                                    {
                                        return;
                                    }
                                    try
                                    {
                                        entry->task();
                                    }
                                    catch (const std::exception &ex)
                                    {
                                        spdlog::error("Periodic task {} failed: {}", entry->key, ex.what());
                                    }
                                    arm(entry); });
    }

    void Scheduler::disarm(const std::shared_ptr<Entry> &entry)
    {
        entry->cancelled.store(true);
        asio::post(entry->strand, [entry]
                   { entry->timer.cancel(); });
    }

} // namespace fleetsync::agent
