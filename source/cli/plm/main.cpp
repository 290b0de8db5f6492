#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <nlohmann/json.hpp>

#include <QGuiApplication>
#include <QThreadPool>

#include <plm/util/log.hpp>

#include <plm/config.hpp>
#include <plm/image_loader.hpp>
#include <plm/json_util.hpp>
#include <plm/metadata.hpp>

#include <plm/layout/generate.hpp>
#include <plm/layout/layout_config.hpp>

#include <plm/output/generate.hpp>
#include <plm/output/podofo_text_measurer.hpp>

using LayoutOverrides = std::unordered_map<std::string, std::string>;

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Failed{ false };

    bool m_Preview{ false };
    bool m_ListFields{ false };
    bool m_Deterministic{ false };

    std::optional<fs::path> m_ImageDir{ std::nullopt };
    std::optional<fs::path> m_MetadataFile{ std::nullopt };
    fs::path m_OutputFile{ "plates.pdf" };

    std::optional<std::string> m_LayoutFile{ std::nullopt };
    std::optional<std::string> m_LayoutJson{ std::nullopt };
    LayoutOverrides m_LayoutOverrides{};
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Plate Layout Maker

    --help              Display this information.
    --images <dir>      Lay out all images found in this folder.
    --metadata <file>   Attach metadata from this .csv or .json file.
    --list-fields       Print the metadata fields, then quit.
    --output <file>     Write the plates to this file, the extension
                        selects the format, one of .pdf, .png, .jpg
                        or .svg. Defaults to plates.pdf.
    --preview           Only lay out and write the first plate.
    --deterministic     Write pdf files without a creation date.
    --layout <file>     Load the layout from this file.
    --layout <json>     Load the layout from this json blob.
    --layout            Take all following commands and override
                        layout settings with them.

Layout Overrides are formatted as follows:
    --<name> <value>    Will override the property <name> with the
                        value <value> as if parsed as json, where
                        <name> can be a nested name and refers to
                        the names seen in layout files.
                        For example:
                            --mode Puzzle
                            --grid.columns 4
                            --caption.fields ["site","period"]
)"
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    const auto next_param{
        [&](size_t& i) -> std::optional<std::string_view>
        {
            if (i + 1 < argv.size())
            {
                ++i;
                return argv[i];
            }
            LogError("Missing parameter for command line option {}", argv[i]);
            cli.m_Failed = true;
            return std::nullopt;
        }
    };

    size_t i{ 1 };
    for (; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--preview")
        {
            cli.m_Preview = true;
        }
        else if (arg == "--list-fields")
        {
            cli.m_ListFields = true;
        }
        else if (arg == "--deterministic")
        {
            cli.m_Deterministic = true;
        }
        else if (arg == "--images")
        {
            if (const auto param{ next_param(i) })
            {
                cli.m_ImageDir = fs::path{ param.value() };
            }
        }
        else if (arg == "--metadata")
        {
            if (const auto param{ next_param(i) })
            {
                cli.m_MetadataFile = fs::path{ param.value() };
            }
        }
        else if (arg == "--output")
        {
            if (const auto param{ next_param(i) })
            {
                cli.m_OutputFile = fs::path{ param.value() };
            }
        }
        else if (arg == "--layout")
        {
            if (i + 1 >= argv.size() ||
                std::string_view{ argv[i + 1] }.starts_with("--"))
            {
                // Parse overrides from now on out
                ++i;
                break;
            }
            else
            {
                ++i;
                std::string param{ argv[i] };
                if (fs::exists(param))
                {
                    cli.m_LayoutFile = std::move(param);
                }
                else
                {
                    cli.m_LayoutJson = std::move(param);
                }
            }
        }
        else
        {
            LogError("Unknown command line option {}", arg);
            cli.m_Failed = true;
        }
    }

    for (; i + 1 < argv.size(); i += 2)
    {
        const std::string_view arg{ argv[i] };
        if (!arg.starts_with("--"))
        {
            LogError("Error while parsing layout overrides. Expected --<value> but got {}", argv[i]);
            cli.m_Failed = true;
            return cli;
        }

        const std::string_view param{ argv[i + 1] };
        cli.m_LayoutOverrides[std::string{ arg.substr(2) }] = param;
    }

    if (i < argv.size())
    {
        LogError("Layout override {} is missing a value", argv[i]);
        cli.m_Failed = true;
    }

    return cli;
}

nlohmann::json ParseOverride(const std::string& value)
{
    try
    {
        // Try parsing the override as a literal ...
        return nlohmann::json::parse(value);
    }
    catch (const nlohmann::json::parse_error&)
    {
        // ... and keep it as a string if that's not possible.
        return value;
    }
}

LayoutConfig LoadLayout(const CommandLineOptions& cli)
{
    nlohmann::json layout_json{};
    if (cli.m_LayoutFile.has_value())
    {
        layout_json = DumpLayoutConfig(LoadLayoutConfig(fs::path{ cli.m_LayoutFile.value() }));
    }
    else if (cli.m_LayoutJson.has_value())
    {
        try
        {
            layout_json = nlohmann::json::parse(cli.m_LayoutJson.value());
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw GenerationError{ fmt::format("Failed loading layout from json-blob: {}", e.what()) };
        }
    }
    else
    {
        LogInfo("Starting from the default layout...");
        layout_json = DumpLayoutConfig(LoadLayoutConfig(nlohmann::json::object()));
    }

    for (const auto& [path, value] : cli.m_LayoutOverrides)
    {
        try
        {
            SetJsonValue(layout_json, path, ParseOverride(value));
        }
        catch (const std::logic_error& e)
        {
            throw GenerationError{ fmt::format("Can't override layout option {}: {}", path, e.what()) };
        }
    }

    return LoadLayoutConfig(layout_json);
}

int main(int argc, char** argv)
{
    // Text rendering for svg output needs a gui application, but never a screen
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM"))
    {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app{ argc, argv };

    Log::RegisterThreadName("MainThread");

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::File |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailThread |
        LogFlags::DetailStacktrace
    };
    Log main_log{ log_flags, Log::c_MainLogName };

    g_Cfg = LoadConfig();
    QThreadPool::globalInstance()->setMaxThreadCount(static_cast<int>(g_Cfg.m_MaxWorkerThreads));

    const CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_HelpDisplayed)
    {
        return 0;
    }
    if (cli.m_Failed)
    {
        fmt::print("{}", c_HelpStr);
        return 1;
    }

    if (cli.m_Deterministic)
    {
        g_Cfg.m_DeterministicPdfOutput = true;
    }

    try
    {
        const MetadataTable metadata{
            cli.m_MetadataFile.has_value()
                ? LoadMetadata(cli.m_MetadataFile.value())
                : MetadataTable{}
        };

        if (cli.m_ListFields)
        {
            fmt::print("{}\n", fmt::join(ListMetadataFields(metadata), "\n"));
            return 0;
        }

        if (!cli.m_ImageDir.has_value())
        {
            LogError("No image folder given, use --images <dir>");
            return 1;
        }

        const LayoutConfig layout{ LoadLayout(cli) };
        LoadedImages loaded{
            LoadImages(cli.m_ImageDir.value(),
                       metadata,
                       ImageLoadOptions{
                           .m_Timeout = g_Cfg.m_DecodeTimeout,
                       }),
        };

        const PoDoFoTextMeasurer measurer{};
        const Document document{
            cli.m_Preview
                ? AssembleDocument({ PreviewFirstPage(loaded.m_Images, layout, measurer) },
                                   std::move(loaded.m_Failures),
                                   ScaleReport{ .m_Factor = layout.m_Scale.m_Factor })
                : GenerateDocument(loaded.m_Images, layout, measurer, std::move(loaded.m_Failures))
        };

        if (document.Status() == PlacementStatus::PartiallyPlaced)
        {
            LogWarning("Only {} of the images were placed, see the warnings above", document.m_TotalImages);
        }

        const fs::path written{ EncodeDocument(document, cli.m_OutputFile) };
        LogInfo("Wrote {} plates to {}", document.m_TotalPages, written.string());
    }
    catch (const GenerationError& e)
    {
        LogError("Layout failed: {}", e.what());
        return 1;
    }
    catch (const EncodingError& e)
    {
        LogError("Writing output failed: {}", e.what());
        return 1;
    }

    return 0;
}
