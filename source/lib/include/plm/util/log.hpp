#pragma once

#include <algorithm>
#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

#include <fmt/format.h>

#include <plm/util/typedefs.hpp>

/*
        A Log can be called from any thread and writes to the console and/or a log file,
        both are optional and chosen at construction.
        Logging without a registered instance is a no-op, so library code can always log.
*/
class Log
{
  public:
    Log(LogFlags log_flags, std::string_view log_name);
    ~Log();

    static Log* GetInstance(std::string_view log_name);

    static bool RegisterThreadName(std::string_view thread_name);
    static std::string_view GetThreadName(const std::thread::id& thread_id);

    enum class LogLevel
    {
        Information,
        Debug,
        Warning,
        Error,
        Fatal
    };

    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
        std::size_t m_Column;
        std::string_view m_Function;
        std::string_view m_Thread;
        std::vector<std::string> m_StackTrace;
    };

    /*
            Hooks receive every message after formatting, e.g. for collecting warnings
    */
    using LogHook = std::function<void(const Log::DetailInformation&, Log::LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

    /*
            Wrapper for a log message, ensures that used strings are constant expressions
    */
    template<class... Args>
    struct LogMessageWrapper
    {
        consteval LogMessageWrapper(const char* message, std::source_location source_info = std::source_location::current())
            : m_Message{ message }
            , m_SourceInfo{ source_info }
        {
        }

        fmt::format_string<Args...> m_Message{};
        std::source_location m_SourceInfo{};
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<std::type_identity_t<Args>...>;

    bool GetStacktraceEnabled(LogLevel level) const;

    void PrintRaw(const DetailInformation& detail_info, LogLevel level, const char* message);
    template<class... Args>
    void Print(const DetailInformation& detail_info, LogLevel level, fmt::format_string<Args...> message, Args&&... args)
    {
        const auto formatted{ fmt::format(message, std::forward<Args>(args)...) };
        PrintRaw(detail_info, level, formatted.c_str());
    }

    template<class... Args>
    static void DoLog(std::string_view log_name, LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        Log* log_sink{ Log::GetInstance(log_name) };
        if (log_sink)
        {
#ifdef _WIN32
            std::string file{ message.m_SourceInfo.file_name() };
            std::ranges::replace(file, '\\', '/');
#else
            std::string_view file{ message.m_SourceInfo.file_name() };
#endif
            DetailInformation detail_info{
                std::time(nullptr),
                file,
                message.m_SourceInfo.line(),
                message.m_SourceInfo.column(),
                message.m_SourceInfo.function_name(),
                GetThreadName(std::this_thread::get_id()),
                {},
            };

#ifdef __cpp_lib_stacktrace
            if (log_sink->GetStacktraceEnabled(level))
            {
                for (const auto& stack_elem : std::stacktrace::current(2))
                {
                    detail_info.m_StackTrace.push_back(
                        fmt::format("  {:<64} @ {}:{}",
                                    stack_elem.description(),
                                    stack_elem.source_file(),
                                    stack_elem.source_line()));
                }
            }
#endif
            log_sink->Print(detail_info, level, message.m_Message, std::forward<Args>(args)...);
        }
    }

    static constexpr std::string_view c_MainLogName{ "Main-Log" };

  private:
    class LogImpl;
    std::unique_ptr<LogImpl> m_Impl;
};

template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Debug, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogWarning(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Warning, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogError(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Error, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogFatal(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Fatal, message, std::forward<Args>(args)...);
}
