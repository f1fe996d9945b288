//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Defaults.hpp"
#include "Components/Security/PlatformDetector.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DefaultPlatform = "android";

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_platform(Security::Platform::Android)
    , m_optOneTimePassword()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    boost::program_options::options_description general("General Options");
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };

        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    // Option to disable console output.
    {
        AddGeneralOption(
            Quiet.data(),
            boost::program_options::bool_switch()->default_value(false),
            "Disables all output to the console.");
    }

    m_descriptions.add(general);

    boost::program_options::options_description simulation("Simulation Options");
    auto AddSimulationOption = simulation.add_options();

    // Option to set the configuration filepath.
    {
        AddSimulationOption(
            ConfigurationFilepath.data(),
            boost::program_options::value(&m_configurationFilepath)->value_name("<filepath>")->default_value(
                Configuration::Defaults::ConfigurationFilepath.string()),
            "Set the configuration filepath.");
    }

    // Option to select the simulated device platform.
    {
        AddSimulationOption(
            Platform.data(),
            boost::program_options::value<std::string>()->value_name("<platform>")->default_value(
                std::string{ local::DefaultPlatform }),
            "The platform of the simulated device SDK. Options: [android, ios]");
    }

    // Option to set the password entered by the simulated cardholder.
    {
        AddSimulationOption(
            OneTimePassword.data(),
            boost::program_options::value<std::string>()->value_name("<digits>"),
            "The one time password submitted by the simulated cardholder. "
            "If not provided, the configured password is submitted.");
    }

    m_descriptions.add(simulation);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char const* const* argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options,
        std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    constexpr auto CheckConflictingOptions = [] (
        boost::program_options::variables_map const& options,
        std::string_view left,
        std::string_view right) -> std::optional<std::string>
    {
        if (options.count(left.data()) && !options[left.data()].defaulted() &&
            options.count(right.data()) && !options[right.data()].defaulted()) {
            std::ostringstream oss;
            oss << "Conflicting options '" << left << "' and '" << right << "'.";
            return oss.str();
        }
        return {};
    };

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);
        boost::program_options::notify(m_options);
    } catch (boost::program_options::error const& e) {
        std::cout << "An error occured parsing startup options due to: ";
        std::cout << e.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (auto const optError = CheckConflictingOptions(m_options, Verbosity, Quiet); optError) {
        std::cout << *optError << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (m_options[Quiet.data()].as<bool>()) { m_verbosity = spdlog::level::off; }

    if (m_configurationFilepath.empty()) {
        std::cout << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    auto const optPlatform = Security::ParsePlatform(m_options[Platform.data()].as<std::string>());
    if (!optPlatform) {
        std::cout << "Unrecognized platform! Options: [android, ios]" << std::endl;
        return ParseCode::Malformed;
    }
    m_platform = *optPlatform;

    if (m_options.count(OneTimePassword.data())) {
        auto const& password = m_options[OneTimePassword.data()].as<std::string>();
        if (password.empty()) {
            std::cout << "The one time password cannot be empty." << std::endl;
            return ParseCode::Malformed;
        }
        m_optOneTimePassword = password;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText(char const* const* argv) const
{
    std::ostringstream oss;
    std::string const name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText(char const* const* argv) const
{
    std::ostringstream oss;
    std::string const name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (3DS " << Acs::ProtocolVersion << " ACS Simulator) " << Acs::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
