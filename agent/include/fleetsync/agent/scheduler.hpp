/**
 * fleetsync - Named, cancellable periodic tasks on the agent's worker pool.
 */
#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleetsync::agent
{

    class Scheduler
    {
    public:
        using Task = std::function<void()>;

        explicit Scheduler(asio::io_context &io_context);
        ~Scheduler();

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        // Runs task every interval, first after one interval. An existing task under
        // the same key is cancelled and replaced. Runs of one task never overlap.
        void schedule_periodic(const std::string &key, std::chrono::milliseconds interval, Task task);

        // Returns false if no task was registered under key. A cancelled task does not
        // run again, even when its timer has already expired.
        bool cancel(const std::string &key);

        bool contains(const std::string &key) const;
        std::size_t size() const;
        std::vector<std::string> keys() const;

        void cancel_all();

    private:
        struct Entry;

        static void arm(const std::shared_ptr<Entry> &entry);
        static void disarm(const std::shared_ptr<Entry> &entry);

        asio::io_context &io_context_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    };

} // namespace fleetsync::agent
