#include <plm/util.hpp>

#include <cctype>
#include <ranges>

std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions)
{
    std::vector<fs::path> files;
    ForEachFile(
        path,
        [&files](const fs::path& path)
        {
            files.push_back(path);
        },
        extensions);
    return files;
}

std::string ToLower(std::string_view str)
{
    return str |
           std::views::transform([](char c)
                                 { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }) |
           std::ranges::to<std::string>();
}

bool HasExtension(const fs::path& path, std::string_view extension)
{
    return ToLower(path.extension().string()) == extension;
}
