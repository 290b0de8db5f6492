#include <plm/json_util.hpp>

#include <functional>
#include <ranges>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

static auto SplitPath(std::string_view path)
{
    static constexpr auto c_ToStrings{ std::views::transform(
        [](auto str)
        { return std::string(str.data(), str.size()); }) };
    return path | std::views::split('.') | c_ToStrings;
}

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value)
{
    std::reference_wrapper target_json{ root };
    for (const auto& path_part : SplitPath(path))
    {
        if (target_json.get().is_null())
        {
            target_json.get() = nlohmann::json::object();
        }
        else if (!target_json.get().is_object())
        {
            throw std::logic_error{
                fmt::format("Path {} is not part of json object", path)
            };
        }

        target_json = target_json.get()[path_part];
    }

    target_json.get() = std::move(value);
    return target_json.get();
}
