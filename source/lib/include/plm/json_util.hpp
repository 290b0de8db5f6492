#pragma once

#include <string_view>

#include <nlohmann/json_fwd.hpp>

/*
        Writes into nested json objects with dotted paths, e.g. "caption.font_size",
        intermediate objects are created as needed
*/
nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value);
