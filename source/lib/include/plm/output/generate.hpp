#pragma once

#include <optional>

#include <plm/layout/document.hpp>
#include <plm/util.hpp>

enum class OutputFormat
{
    Pdf,
    Png,
    Jpg,
    Svg,
};

std::optional<OutputFormat> OutputFormatFromPath(const fs::path& path);

/*
        Renders the document in the format matching the file extension, a single file for
        pdf and a folder with one file per page otherwise. Returns the written path.
        Throws EncodingError, the document itself is never modified.
*/
fs::path EncodeDocument(const Document& document, const fs::path& path);
