#include <plm/metadata.hpp>

#include <algorithm>
#include <fstream>
#include <ranges>
#include <sstream>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <plm/layout/errors.hpp>
#include <plm/util/log.hpp>

const MetadataFields* MetadataTable::Find(std::string_view image_name) const
{
    if (const auto it{ m_Rows.find(std::string{ image_name }) }; it != m_Rows.end())
    {
        return &it->second;
    }

    const std::string stem{ fs::path{ image_name }.stem().string() };
    if (const auto it{ m_Rows.find(stem) }; it != m_Rows.end())
    {
        return &it->second;
    }
    return nullptr;
}

static std::vector<std::vector<std::string>> SplitCsvRecords(std::string_view csv)
{
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes{ false };
    bool any_content{ false };

    const auto end_field{
        [&]()
        {
            record.push_back(std::move(field));
            field.clear();
        }
    };
    const auto end_record{
        [&]()
        {
            end_field();
            if (any_content)
            {
                records.push_back(std::move(record));
            }
            record.clear();
            any_content = false;
        }
    };

    for (size_t i = 0; i < csv.size(); i++)
    {
        const char c{ csv[i] };
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < csv.size() && csv[i + 1] == '"')
                {
                    field.push_back('"');
                    i++;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                field.push_back(c);
            }
            continue;
        }

        switch (c)
        {
        case '"':
            in_quotes = true;
            any_content = true;
            break;
        case ',':
            end_field();
            any_content = true;
            break;
        case '\r':
            break;
        case '\n':
            end_record();
            break;
        default:
            field.push_back(c);
            any_content = true;
            break;
        }
    }
    end_record();

    return records;
}

static std::string Trim(std::string str)
{
    const auto first{ str.find_first_not_of(" \t") };
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last{ str.find_last_not_of(" \t") };
    return str.substr(first, last - first + 1);
}

MetadataTable ParseCsvMetadata(std::string_view csv)
{
    // Excel likes to put a BOM in front
    if (csv.starts_with("\xEF\xBB\xBF"))
    {
        csv.remove_prefix(3);
    }

    auto records{ SplitCsvRecords(csv) };
    if (records.empty())
    {
        return MetadataTable{};
    }

    MetadataTable table{};
    const auto& header{ records.front() };
    for (size_t i = 1; i < header.size(); i++)
    {
        table.m_Fields.push_back(Trim(header[i]));
    }

    for (auto& record : records | std::views::drop(1))
    {
        std::string name{ Trim(record.front()) };
        if (name.empty())
        {
            continue;
        }

        MetadataFields fields;
        for (size_t i = 0; i < table.m_Fields.size(); i++)
        {
            fields.push_back(MetadataField{
                .m_Name{ table.m_Fields[i] },
                .m_Value{ i + 1 < record.size() ? Trim(std::move(record[i + 1])) : std::string{} },
            });
        }
        table.m_Rows[std::move(name)] = std::move(fields);
    }

    return table;
}

static std::string JsonValueToString(const nlohmann::json& value)
{
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    else if (value.is_null())
    {
        return {};
    }
    return value.dump();
}

static MetadataTable ParseJsonMetadata(const nlohmann::json& json)
{
    if (!json.is_object())
    {
        throw GenerationError{ "Metadata json must be an object keyed by file name" };
    }

    MetadataTable table{};
    for (const auto& [name, row] : json.items())
    {
        if (!row.is_object())
        {
            LogWarning("Ignoring metadata for {}, it is not an object", name);
            continue;
        }

        MetadataFields fields;
        for (const auto& [field, value] : row.items())
        {
            if (!std::ranges::contains(table.m_Fields, field))
            {
                table.m_Fields.push_back(field);
            }
            fields.push_back(MetadataField{
                .m_Name{ field },
                .m_Value{ JsonValueToString(value) },
            });
        }
        table.m_Rows[name] = std::move(fields);
    }

    return table;
}

MetadataTable LoadMetadata(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary };
    if (!file.is_open())
    {
        throw GenerationError{ fmt::format("Could not open metadata file {}", path.string()) };
    }

    MetadataTable table{};
    if (HasExtension(path, ".json"))
    {
        try
        {
            table = ParseJsonMetadata(nlohmann::json::parse(file));
        }
        catch (const nlohmann::json::exception& e)
        {
            throw GenerationError{ fmt::format("Malformed metadata file {}: {}", path.string(), e.what()) };
        }
    }
    else if (HasExtension(path, ".csv"))
    {
        std::stringstream buffer;
        buffer << file.rdbuf();
        table = ParseCsvMetadata(buffer.str());
    }
    else
    {
        throw GenerationError{ fmt::format("Unsupported metadata file {}, expected .csv or .json", path.string()) };
    }

    LogInfo("Loaded metadata for {} images with {} fields from {}", table.m_Rows.size(), table.m_Fields.size(), path.string());
    return table;
}

std::vector<std::string> ListMetadataFields(const MetadataTable& table)
{
    return table.m_Fields;
}
