#if !defined(_LACQ_INFRA_LOGGING_H_INCLUDED_)
#define _LACQ_INFRA_LOGGING_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    namespace details
    {
        inline std::shared_ptr<spdlog::logger> g_logger { nullptr };
        inline spdlog::sink_ptr g_console_sink { nullptr };
        inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_transcript_sink { nullptr };
    }  // namespace details

    inline void global_initialize_logging()
    {
        try {
            details::g_logger = spdlog::stderr_color_mt("console", spdlog::color_mode::automatic);
            details::g_logger->set_pattern("[%Y-%m-%d %T.%e %z] %^%L: %v%$");
            details::g_logger->flush_on(spdlog::level::info);
            details::g_logger->set_level(spdlog::level::trace);

            details::g_console_sink = details::g_logger->sinks().front();
            details::g_console_sink->set_level(spdlog::level::info);
        }
        catch (const std::exception& ex) {
            fprintf(stdout, "global_initialize_logging() exception: %s", ex.what());
            fflush(stdout);
            throw;
        }
    }

    inline void global_finalize_logging()
    {
        if (details::g_logger) {
            details::g_logger->flush();
            details::g_logger.reset();
        }
        details::g_console_sink.reset();
        details::g_transcript_sink.reset();
    }

    //
    // Verbosity only filters the console: the logger itself lets everything
    // through, so that the transcript sink keeps its own level.
    //
    inline void set_logging_verbosity(const int verbosity)
    {
        spdlog::level::level_enum level;
        if (verbosity >= 2) {
            level = spdlog::level::trace;
        }
        else if (verbosity == 1) {
            level = spdlog::level::debug;
        }
        else if (verbosity == 0) {
            level = spdlog::level::info;
        }
        else if (verbosity == -1) {
            level = spdlog::level::warn;
        }
        else {  // verbosity <= -2
            level = spdlog::level::err;
        }
        details::g_console_sink->set_level(level);
    }

    inline spdlog::level::level_enum console_logging_level()
    {
        return details::g_console_sink->level();
    }

    //
    // The transcript is a file sink appended to the global logger, so that every
    // message of a run is written both to the console and to the transcript file.
    // The transcript always records info level and above, whatever the console
    // verbosity is.
    //
    inline void attach_transcript(const stdfs::path& path)  // throws spdlog::spdlog_ex
    {
        if (details::g_transcript_sink) {
            return;
        }

        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), /*truncate*/false);
        sink->set_pattern("[%Y-%m-%d %T %z] %L: %v");
        sink->set_level(spdlog::level::info);
        details::g_logger->sinks().push_back(sink);
        details::g_transcript_sink = std::move(sink);
    }

    inline void detach_transcript() noexcept
    {
        if (!details::g_transcript_sink) {
            return;
        }

        details::g_transcript_sink->flush();
        auto& sinks = details::g_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), details::g_transcript_sink), sinks.end());
        details::g_transcript_sink.reset();
    }

    inline bool is_transcript_attached() noexcept
    {
        return (details::g_transcript_sink != nullptr);
    }


#define LOG_ERROR(...)      SPDLOG_LOGGER_ERROR(::infra::details::g_logger, __VA_ARGS__)
#define LOG_WARN(...)       SPDLOG_LOGGER_WARN(::infra::details::g_logger, __VA_ARGS__)
#define LOG_INFO(...)       SPDLOG_LOGGER_INFO(::infra::details::g_logger, __VA_ARGS__)
#define LOG_DEBUG(...)      SPDLOG_LOGGER_DEBUG(::infra::details::g_logger, __VA_ARGS__)
#define LOG_TRACE(...)      SPDLOG_LOGGER_TRACE(::infra::details::g_logger, __VA_ARGS__)

}  // namespace infra

#endif  // !defined(_LACQ_INFRA_LOGGING_H_INCLUDED_)
