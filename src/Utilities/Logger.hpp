//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Registration of the shared "core" logger. Components fetch the logger by name and hold onto the
// shared pointer, additional sinks may be attached at any time (e.g. to capture output in tests).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Name = "core";

void Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);

//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

[[nodiscard]] std::string Generate(std::string_view color, std::string_view tag);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Critical = "\x1b[1;38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";
constexpr spdlog::string_view_t Trace = "\x1b[38;2;255;255;255m";

constexpr std::string_view Reset = "\x1b[0m";

[[nodiscard]] std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    if (auto const spCore = spdlog::get(Name.data()); !spCore) {
        spdlog::register_logger(std::make_shared<spdlog::logger>(Name.data()));

        if (useStdOutSink) {
            auto const spCoreSink = Color::CreateTrueColorConsole();
            spCoreSink->set_pattern(Pattern::Generate(Color::Core, Name));
            AttachSink(spCoreSink);
        }
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    auto spCore = spdlog::get(Name.data());
    assert(spCore);
    spCore->sinks().emplace_back(spSink);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Logger::Pattern::Generate(std::string_view color, std::string_view tag)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    oss << TagOpen << color << tag << Color::Reset << TagClose << TagSeperator;
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> Logger::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::automatic);
    spColorSink->set_color(spdlog::level::info, Color::Info);
    spColorSink->set_color(spdlog::level::warn, Color::Warn);
    spColorSink->set_color(spdlog::level::err, Color::Error);
    spColorSink->set_color(spdlog::level::critical, Color::Critical);
    spColorSink->set_color(spdlog::level::debug, Color::Debug);
    spColorSink->set_color(spdlog::level::trace, Color::Trace);

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
