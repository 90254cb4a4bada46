#include "fleetsync/agent/system_info.hpp"

#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        constexpr std::array<const char *, 4> kReleaseMarkers{
            "/etc/ubuntu_version",
            "/etc/centos-release",
            "/etc/debian_version",
            "/etc/redhat-release",
        };

        constexpr std::array<const char *, 4> kReleaseNames{"Ubuntu", "CentOS", "Debian", "RedHat"};

        std::string unquote(std::string value)
        {
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            {
                return value.substr(1, value.size() - 2);
            }
            return value;
        }

    } // namespace

    std::string local_hostname()
    {
        std::array<char, 256> buffer{};
        if (::gethostname(buffer.data(), buffer.size() - 1) != 0)
        {
            spdlog::warn("gethostname failed, using 'unknown'");
            return "unknown";
        }
        return std::string(buffer.data());
    }

    std::string os_description()
    {
        std::ifstream release("/etc/os-release");
        std::string line;
        while (release && std::getline(release, line))
        {
            constexpr std::string_view prefix = "PRETTY_NAME=";
            if (line.rfind(prefix, 0) == 0)
            {
                return unquote(line.substr(prefix.size()));
            }
        }

        std::error_code ec;
        for (std::size_t i = 0; i < kReleaseMarkers.size(); ++i)
        {
            if (std::filesystem::exists(kReleaseMarkers[i], ec))
            {
                return kReleaseNames[i];
            }
        }

        struct utsname info
        {
        };
        if (::uname(&info) == 0)
        {
            return std::string(info.sysname) + " " + info.release;
        }
        return "Linux";
    }

    protocol::SystemInfo collect_system_info(const std::filesystem::path &data_dir)
    {
        protocol::SystemInfo info{
            .hostname = local_hostname(),
            .os = os_description(),
        };

        struct sysinfo stats
        {
        };
        if (::sysinfo(&stats) == 0)
        {
            const auto unit = static_cast<std::uint64_t>(stats.mem_unit == 0 ? 1 : stats.mem_unit);
            info.uptime = static_cast<std::uint64_t>(stats.uptime);
            info.memory_usage = (static_cast<std::uint64_t>(stats.totalram) - stats.freeram - stats.bufferram) * unit;

            const auto cpus = std::max(1u, std::thread::hardware_concurrency());
            const double load = static_cast<double>(stats.loads[0]) / static_cast<double>(1u << SI_LOAD_SHIFT);
            info.cpu_usage = std::min(100.0, load / cpus * 100.0);
        }
        else
        {
            spdlog::debug("sysinfo failed, memory and uptime not reported");
        }

        std::error_code ec;
        const auto target = data_dir.empty() ? std::filesystem::current_path(ec) : data_dir;
        const auto space = std::filesystem::space(target, ec);
        if (!ec)
        {
            info.disk_usage = space.capacity - space.free;
        }
        else
        {
            spdlog::debug("Cannot stat volume of {}: {}", target.string(), ec.message());
        }
        return info;
    }

} // namespace fleetsync::agent
