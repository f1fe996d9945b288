//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view Platform = "platform";
    static constexpr std::string_view OneTimePassword = "one-time-password";

    Options();

    [[nodiscard]] ParseCode Parse(std::int32_t argc, char const* const* argv);

    [[nodiscard]] std::string GenerateHelpText(char const* const* argv) const;
    [[nodiscard]] std::string GenerateVersionText(char const* const* argv) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosityLevel() const { return m_verbosity; }
    [[nodiscard]] std::string const& GetConfigPath() const { return m_configurationFilepath; }
    [[nodiscard]] Security::Platform GetPlatform() const { return m_platform; }
    [[nodiscard]] std::optional<std::string> const& GetOneTimePassword() const { return m_optOneTimePassword; }

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    void SetupDescriptions();

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::string m_configurationFilepath;
    Security::Platform m_platform;
    std::optional<std::string> m_optOneTimePassword;
};

//----------------------------------------------------------------------------------------------------------------------
