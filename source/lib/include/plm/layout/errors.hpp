#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/*
        Thrown for configurations that cannot produce a document at all,
        problems with individual images are reported as GenerationFailure instead
*/
class GenerationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/*
        Thrown by the encoders, the document that was being encoded stays valid
*/
class EncodingError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

enum class FailureKind
{
    ImageLoadFailure,
    OversizedImage,
    InfeasibleAutoScale,
    MissingManualPlacement,
    InvalidManualPlacement,
};

struct GenerationFailure
{
    FailureKind m_Kind;
    // Empty for failures not tied to a single image
    std::string m_ImageName;
    std::string m_Message;

    bool operator==(const GenerationFailure&) const = default;
};
using GenerationFailures = std::vector<GenerationFailure>;
