#include <plm/image_loader.hpp>

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include <QRunnable>
#include <QThreadPool>

#include <fmt/format.h>

#include <plm/image.hpp>
#include <plm/layout/sort.hpp>
#include <plm/util/log.hpp>

namespace
{
struct DecodeState
{
    std::mutex m_Mutex;
    std::condition_variable m_Finished;
    std::vector<std::optional<dla::ivec2>> m_Sizes;
    std::vector<bool> m_Done;
    size_t m_Remaining;
    std::atomic_bool m_Cancelled{ false };
};

class DecodeWork : public QRunnable
{
  public:
    DecodeWork(std::shared_ptr<DecodeState> state, fs::path path, size_t index)
        : m_State{ std::move(state) }
        , m_Path{ std::move(path) }
        , m_Index{ index }
    {
        setAutoDelete(true);
    }

    virtual void run() override
    {
        std::optional<dla::ivec2> size{};
        if (!m_State->m_Cancelled.load(std::memory_order_relaxed))
        {
            const Image image{ Image::Read(m_Path) };
            if (image.Valid())
            {
                size = image.Size();
            }
        }

        {
            std::lock_guard lock{ m_State->m_Mutex };
            m_State->m_Sizes[m_Index] = size;
            m_State->m_Done[m_Index] = true;
            m_State->m_Remaining--;
        }
        m_State->m_Finished.notify_all();
    }

  private:
    std::shared_ptr<DecodeState> m_State;
    fs::path m_Path;
    size_t m_Index;
};
} // namespace

LoadedImages LoadImages(const fs::path& image_dir, const MetadataTable& metadata, const ImageLoadOptions& options)
{
    if (!fs::is_directory(image_dir))
    {
        throw GenerationError{ fmt::format("Image directory {} does not exist", image_dir.string()) };
    }

    auto files{ ListFiles(image_dir, g_SupportedImageExtensions) };
    std::ranges::sort(files,
                      [](const fs::path& lhs, const fs::path& rhs)
                      {
                          return NaturalCompare(lhs.filename().string(), rhs.filename().string()) < 0;
                      });

    LogInfo("Decoding {} images from {}", files.size(), image_dir.string());

    auto state{ std::make_shared<DecodeState>() };
    state->m_Sizes.resize(files.size());
    state->m_Done.resize(files.size(), false);
    state->m_Remaining = files.size();

    for (size_t i = 0; i < files.size(); i++)
    {
        QThreadPool::globalInstance()->start(new DecodeWork{ state, files[i], i });
    }

    {
        static constexpr std::chrono::milliseconds c_PollInterval{ 50 };
        const auto deadline{ std::chrono::steady_clock::now() + options.m_Timeout };

        std::unique_lock lock{ state->m_Mutex };
        while (state->m_Remaining > 0)
        {
            if (options.m_Cancel != nullptr && options.m_Cancel->load(std::memory_order_relaxed))
            {
                LogWarning("Image decoding was cancelled");
                break;
            }

            if (std::chrono::steady_clock::now() >= deadline)
            {
                LogWarning("Image decoding timed out after {} ms", options.m_Timeout.count());
                break;
            }

            state->m_Finished.wait_for(lock, c_PollInterval);
        }
        state->m_Cancelled.store(true, std::memory_order_relaxed);
    }

    LoadedImages loaded{};
    std::lock_guard lock{ state->m_Mutex };
    for (size_t i = 0; i < files.size(); i++)
    {
        const std::string name{ files[i].filename().string() };
        if (!state->m_Done[i] || !state->m_Sizes[i].has_value())
        {
            loaded.m_Failures.push_back(GenerationFailure{
                .m_Kind = FailureKind::ImageLoadFailure,
                .m_ImageName{ name },
                .m_Message{
                    state->m_Done[i]
                        ? fmt::format("Could not decode image {}, it is skipped", name)
                        : fmt::format("Image {} was not decoded in time, it is skipped", name),
                },
            });
            continue;
        }

        const MetadataFields* fields{ metadata.Find(name) };
        loaded.m_Images.push_back(ImageItem{
            .m_Name{ name },
            .m_Source{ files[i] },
            .m_Size{ state->m_Sizes[i].value() },
            .m_Metadata{ fields != nullptr ? *fields : MetadataFields{} },
        });
    }

    LogInfo("Decoded {} images, {} failed", loaded.m_Images.size(), loaded.m_Failures.size());
    return loaded;
}
