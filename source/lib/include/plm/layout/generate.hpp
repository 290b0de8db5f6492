#pragma once

#include <span>

#include <plm/layout/document.hpp>
#include <plm/layout/layout_config.hpp>
#include <plm/layout/text_measurer.hpp>
#include <plm/layout/types.hpp>

/*
        Lays out all images according to the configuration and returns the finished document.
        Images that failed to load are passed in as failures and end up in the document.
        Throws GenerationError if the configuration can't produce any page.
*/
Document GenerateDocument(std::span<const ImageItem> images,
                          const LayoutConfig& config,
                          const TextMeasurer& measurer,
                          GenerationFailures load_failures = {});

/*
        Same as GenerateDocument but stops after the first page,
        the page is empty if no image could be placed
*/
Page PreviewFirstPage(std::span<const ImageItem> images,
                      const LayoutConfig& config,
                      const TextMeasurer& measurer);
