#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <plm/layout/types.hpp>
#include <plm/util.hpp>

/*
        Per image metadata keyed by file name, fields keep the order of the source file
*/
struct MetadataTable
{
    std::vector<std::string> m_Fields;
    std::map<std::string, MetadataFields> m_Rows;

    // Matches the full file name first, then the name without extension
    const MetadataFields* Find(std::string_view image_name) const;
};

/*
        Reads a .csv file whose first column holds the file names or a .json object
        of objects keyed by file name. Throws GenerationError on unreadable input.
*/
MetadataTable LoadMetadata(const fs::path& path);

MetadataTable ParseCsvMetadata(std::string_view csv);

std::vector<std::string> ListMetadataFields(const MetadataTable& table);
