#include <plm/util/log_impl.hpp>

#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <QDebug>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName(log_name)
    , m_LogFlags(log_flags)
{
    if (bool(m_LogFlags & LogFlags::File))
        CreateLogFile();
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock read_lock{ g_InstanceListMutex };

    auto it{ g_Instances.find(std::string{ log_name }) };
    if (it != g_Instances.end())
        return it->second->m_ParentLog;
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    std::unique_lock write_lock{ g_InstanceListMutex };
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log {} is already registered", m_LogName) };
    }

    m_ParentLog = parent_log;
    g_Instances[m_LogName] = this;
}
void Log::LogImpl::UnregisterInstance()
{
    std::unique_lock write_lock{ g_InstanceListMutex };
    auto it{ g_Instances.find(m_LogName) };
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
    m_ParentLog = nullptr;
}

bool Log::LogImpl::RegisterThreadName(std::string_view thread_name)
{
    std::unique_lock write_lock{ g_ThreadListMutex };

    const std::thread::id thread_id{ std::this_thread::get_id() };
    if (g_ThreadList.contains(thread_id))
        return false;

    g_ThreadList[thread_id] = thread_name;
    return true;
}

std::string_view Log::LogImpl::GetThreadName(const std::thread::id& thread_id)
{
    std::shared_lock read_lock{ g_ThreadListMutex };

    auto it{ g_ThreadList.find(thread_id) };
    if (it != g_ThreadList.end())
        return it->second;

    return "Worker";
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    const uint32_t hook_id{ ++m_NextHookId };
    m_LogHooks.push_back({ hook_id, std::move(hook) });
    return hook_id;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

bool Log::LogImpl::GetStacktraceEnabled(LogLevel level) const
{
    const LogFlags stacktrace_bits{ m_LogFlags & LogFlags::DetailStacktrace };
    return (level == LogLevel::Error && bool(stacktrace_bits & LogFlags::DetailErrorStacktrace)) ||
           (level == LogLevel::Fatal && bool(stacktrace_bits & LogFlags::DetailFatalStacktrace));
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, const char* message)
{
    Flush(detail_info, level, message);

    if (bool(m_LogFlags & LogFlags::FatalQuit) && level == LogLevel::Fatal)
    {
        std::exit(-1);
    }
}

void Log::LogImpl::Flush(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    std::stringstream stream;

    switch (level)
    {
    case LogLevel::Information:
        stream << " [INFO]";
        break;
    case LogLevel::Debug:
        stream << "[DEBUG]";
        break;
    case LogLevel::Warning:
        stream << " [WARN]";
        break;
    case LogLevel::Error:
        stream << "[ERROR]";
        break;
    case LogLevel::Fatal:
        stream << "[FATAL]";
        break;
    }

    const LogFlags detail_bits{ m_LogFlags & LogFlags::DetailAll };
    if (bool(detail_bits))
    {
        std::vector<std::string> details;
        if (bool(detail_bits & LogFlags::DetailTime))
        {
            details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
        }
        if (bool(detail_bits & LogFlags::DetailFile))
        {
            std::string_view file{ detail_info.m_File };
            if (file.starts_with(PLM_SOURCE_ROOT))
            {
                file.remove_prefix(std::strlen(PLM_SOURCE_ROOT));
            }
            details.emplace_back(file);
        }
        if (IsSet(detail_bits, LogFlags::DetailColumn))
        {
            details.push_back(fmt::format("{}:{}", detail_info.m_Line, detail_info.m_Column));
        }
        else if (bool(detail_bits & LogFlags::DetailLine))
        {
            details.push_back(fmt::format("{}", detail_info.m_Line));
        }
        if (bool(detail_bits & LogFlags::DetailFunction))
        {
            details.emplace_back(detail_info.m_Function);
        }
        if (bool(detail_bits & LogFlags::DetailThread))
        {
            details.emplace_back(detail_info.m_Thread);
        }
        stream << "<" << fmt::format("{}", fmt::join(details, "; ")) << ">";
    }

    stream << ": " << std::string_view(message) << "\n";

    if (GetStacktraceEnabled(level))
    {
        if (!detail_info.m_StackTrace.empty())
        {
            stream << "Stacktrace:\n";
            for (std::string_view stack_element : detail_info.m_StackTrace)
            {
                stream << stack_element << "\n";
            }
        }
        else
        {
            stream << "[[Stacktrace not available]]\n";
        }
    }

    const std::string full_message_str{ stream.str() };
    std::lock_guard lock{ m_Mutex };

    if (bool(m_LogFlags & LogFlags::Console))
        qDebug().noquote() << full_message_str.c_str();
    if (m_FileStream.is_open())
        m_FileStream << full_message_str << std::flush;

    for (const InstalledLogHook& hook : m_LogHooks)
    {
        hook.m_Hook(detail_info, level, message);
    }
}

void Log::LogImpl::CreateLogFile()
{
    namespace fs = std::filesystem;

    const fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::is_directory(logs_directory))
    {
        fs::remove_all(logs_directory);
        fs::create_directories(logs_directory);
    }

    std::multimap<fs::file_time_type, fs::path> files_sorted_by_modify_time;
    for (const auto& entry : fs::directory_iterator{ logs_directory })
    {
        if (entry.is_regular_file())
        {
            files_sorted_by_modify_time.insert({ entry.last_write_time(), entry.path() });
        }
    }

    static constexpr std::size_t c_MaxNumLogFiles{ 64 };
    while (files_sorted_by_modify_time.size() >= c_MaxNumLogFiles)
    {
        fs::remove(files_sorted_by_modify_time.begin()->second);
        files_sorted_by_modify_time.erase(files_sorted_by_modify_time.begin());
    }

    const auto file_name{
        fmt::format("{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr)))
    };

    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(logs_directory / file_name);
}
