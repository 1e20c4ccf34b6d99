module;

#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

module Core.Logging;

namespace Core::Log
{
    // Log lines go to stderr; stdout carries snapshots and traces.
    static std::mutex s_LogMutex;

    void PrintColored(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);

        // ANSI Color Codes
        const char* color = "\033[0m";
        const char* label = "[INFO]";

        switch (level) {
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
        }

        std::cerr << color << label << msg << "\033[0m" << '\n';
    }

    void StringSink::Record(std::string_view text)
    {
        m_Lines.emplace_back(text);
    }

    std::string StringSink::Take()
    {
        std::string joined;
        for (const auto& line : m_Lines)
        {
            joined += line;
            joined += '\n';
        }
        m_Lines.clear();
        return joined;
    }

    bool StringSink::Contains(std::string_view fragment) const
    {
        for (const auto& line : m_Lines)
        {
            if (line.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    Sink& DiscardSink()
    {
        static NullSink s_Sink;
        return s_Sink;
    }
}
