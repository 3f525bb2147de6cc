#pragma once

#include "reglink/coroutine/coroutine.hpp"
#include "reglink/log/format.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <format>
#include <fstream>
#include <mutex>
#include <print>
#include <source_location>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>

namespace reglink::log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        Level level;
        std::string message;
        std::thread::id threadId;
        std::string file;
        uint32_t line;
        std::string function;
    };

    struct LoggerConfig
    {
        Level minLevel{ Level::Info };
        bool toConsole{ true };
        std::string filePath{};
        bool showTimestamp{ true };
        std::string timestampFormat{ "{:%Y-%m-%d %H:%M:%S}" };
        bool showLevel{ true };
        bool showThreadId{ false };
        bool showFile{ false };
        bool showLine{ false };
        bool showFunction{ false };
    };

    namespace detail
    {
        // "auto ns::Class::method(int) -> void" -> "method"
        constexpr auto shortFunctionName(std::string_view name) -> std::string_view
        {
            auto paren{ name.find('(') };
            if (paren == std::string_view::npos) {
                return name;
            }
            name = name.substr(0, paren);
            if (auto space{ name.rfind(' ') }; space != std::string_view::npos) {
                name.remove_prefix(space + 1);
            }
            if (auto scope{ name.rfind(':') }; scope != std::string_view::npos) {
                name.remove_prefix(scope + 1);
            }
            return name;
        }

        static_assert(shortFunctionName("void test()") == "test");
        static_assert(shortFunctionName("auto plantsim::sim::Controller::cycle(Bank&) -> ChangeSet") == "cycle");
    }

    template<typename... Args>
    struct FormatString
    {
        std::format_string<Args...> str;
        std::source_location loc;

        template<typename T>
            requires std::convertible_to<const T&, std::string_view>
        consteval FormatString(const T& s, std::source_location l = std::source_location::current())
          : str(s)
          , loc(l)
        {
        }
    };

    /**
     * Process-wide asynchronous logger. Callers format on their own thread and
     * push the entry into a channel; a dedicated thread drains it.
     */
    class Logger
    {
      public:
        static auto instance() -> Logger&
        {
            static Logger logger;
            return logger;
        }

        Logger()
          : m_thread([this]() { m_ctx.run(); })
        {
            coro::co_spawn(m_ctx, [this](coro::IExecutor& ex) -> coro::Task<void> { return process(ex); });
        }

        ~Logger()
        {
            flush();
            m_channel.close();
            m_ctx.stop();
            if (m_thread.joinable()) {
                m_thread.join();
            }
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        auto setConfig(LoggerConfig config) -> void
        {
            std::lock_guard lock(m_sinkMutex);
            m_config = std::move(config);
            m_file.close();
            if (!m_config.filePath.empty()) {
                m_file.open(m_config.filePath, std::ios::app);
            }
        }

        auto setLevel(Level level) -> void
        {
            std::lock_guard lock(m_sinkMutex);
            m_config.minLevel = level;
        }

        auto enabled(Level level) -> bool
        {
            std::lock_guard lock(m_sinkMutex);
            return level >= m_config.minLevel;
        }

        template<typename... Args>
        auto log(Level level, std::source_location loc, std::format_string<Args...> fmt, Args&&... args) -> void
        {
            if (!enabled(level)) {
                return;
            }

            std::string msg;
            try {
                msg = std::format(fmt, std::forward<Args>(args)...);
            } catch (const std::exception& e) {
                msg = std::format("<format error: {}>", e.what());
            }

            {
                std::lock_guard lock(m_pendingMutex);
                ++m_pending;
            }
            m_channel.push({ std::chrono::system_clock::now(),
                             level,
                             std::move(msg),
                             std::this_thread::get_id(),
                             loc.file_name(),
                             loc.line(),
                             std::string(detail::shortFunctionName(loc.function_name())) });
        }

        /**
         * Blocks until every entry queued before the call has been written.
         */
        auto flush() -> void
        {
            std::unique_lock lock(m_pendingMutex);
            m_drained.wait_for(lock, std::chrono::seconds(2), [this] { return m_pending == 0; });
        }

      private:
        // the executor argument binds the drain loop to the logger thread
        auto process(coro::IExecutor&) -> coro::Task<void>
        {
            while (true) {
                auto entry = co_await m_channel.next();
                if (!entry) {
                    break;
                }
                write(*entry);

                {
                    std::lock_guard lock(m_pendingMutex);
                    --m_pending;
                }
                m_drained.notify_all();
            }
        }

        auto write(const LogEntry& entry) -> void
        {
            std::lock_guard lock(m_sinkMutex);
            auto text{ render(entry) };

            if (m_config.toConsole) {
                std::println("{}", text);
                std::fflush(stdout);
            }
            if (m_file.is_open()) {
                m_file << text << '\n';
                m_file.flush();
            }
        }

        auto render(const LogEntry& entry) const -> std::string
        {
            std::string out;

            if (m_config.showTimestamp) {
                try {
                    auto ts = std::chrono::floor<std::chrono::milliseconds>(entry.timestamp);
                    out += std::format("[{}] ", std::vformat(m_config.timestampFormat, std::make_format_args(ts)));
                } catch (const std::format_error&) {
                    out += "[Timestamp Error] ";
                }
            }

            if (m_config.showLevel) {
                out += std::format("[{}] ", entry.level);
            }

            if (m_config.showThreadId) {
                std::stringstream ss;
                ss << entry.threadId;
                out += std::format("[Thread {}] ", ss.str());
            }

            if (m_config.showFile || m_config.showLine || m_config.showFunction) {
                out += "[";
                bool first = true;
                if (m_config.showFile) {
                    out += entry.file;
                    first = false;
                }
                if (m_config.showLine) {
                    if (!first)
                        out += ":";
                    out += std::to_string(entry.line);
                    first = false;
                }
                if (m_config.showFunction) {
                    if (!first)
                        out += " ";
                    out += std::format("in {}", entry.function);
                }
                out += "] ";
            }

            out += entry.message;
            return out;
        }

        LoggerConfig m_config{};
        std::mutex m_sinkMutex;
        std::ofstream m_file;

        std::mutex m_pendingMutex;
        std::condition_variable m_drained;
        size_t m_pending{ 0 };

        coro::Channel<LogEntry> m_channel{};
        coro::Context m_ctx{};
        std::thread m_thread;
    };

    template<typename... Args>
    auto debug(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Debug, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto info(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Info, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto warning(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Warning, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto error(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Error, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }
}
