module;
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module Core.Logging;

export namespace Core::Log {

    enum class Level {
        Info,
        Warning,
        Error,
        Debug
    };

    // Writes one colour-tagged line to stderr. Serialized by a global mutex.
    void PrintColored(Level level, std::string_view msg);

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#else
        (void)fmt;
        ((void)args, ...);
#endif
    }

    // -------------------------------------------------------------------------
    // Trace sinks
    // -------------------------------------------------------------------------
    // Per-operation trace text (mesh reports, intermediate values) goes to a
    // sink owned by the caller instead of stdout. Nothing reads it back for
    // control flow.

    class Sink
    {
    public:
        virtual ~Sink() = default;
        virtual void Record(std::string_view text) = 0;
    };

    class NullSink final : public Sink
    {
    public:
        void Record(std::string_view) override {}
    };

    // Accumulates lines until drained with Take().
    class StringSink final : public Sink
    {
    public:
        void Record(std::string_view text) override;

        [[nodiscard]] const std::vector<std::string>& Lines() const noexcept { return m_Lines; }
        [[nodiscard]] std::string Take();
        [[nodiscard]] bool Contains(std::string_view fragment) const;

    private:
        std::vector<std::string> m_Lines;
    };

    // Process-wide no-op sink for callers that do not collect traces.
    [[nodiscard]] Sink& DiscardSink();

    template<typename... Args>
    void Trace(Sink& sink, std::format_string<Args...> fmt, Args&&... args) {
        sink.Record(std::format(fmt, std::forward<Args>(args)...));
    }
}
