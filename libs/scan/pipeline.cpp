/**
 * @file pipeline.cpp
 * @brief Location queue and analyzer dispatch
 */

#include "pkgaudit/scan/pipeline.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace pkgaudit::scan {

namespace {

class PipelineStream final : public OutputStream
{
public:
    PipelineStream(const Config& config, std::vector<AnalyzerPtr> analyzers, ScanLocationPtr root)
        : m_config(config)
        , m_analyzers(std::move(analyzers))
    {
        m_queue.push_back(std::move(root));
    }

    [[nodiscard]] std::optional<ScanOutput> next() override
    {
        while (true) {
            if (m_current) {
                if (auto item = m_current->next()) {
                    if (const auto* location = std::get_if<ScanLocationPtr>(&*item)) {
                        schedule(*location);
                    }
                    return item;
                }
                m_current.reset();
            }
            if (!advance()) {
                return std::nullopt;
            }
        }
    }

private:
    void schedule(const ScanLocationPtr& location)
    {
        if (location->depth() > m_config.max_depth()) {
            spdlog::warn("Maximum depth {} reached, not scanning '{}'",
                         m_config.max_depth(),
                         location->str());
            return;
        }
        m_queue.push_back(location);
    }

    /// Open the stream of the next analyzer; false once all work is done
    bool advance()
    {
        while (true) {
            if (m_location && m_next_analyzer < m_analyzers.size()) {
                m_current = m_analyzers[m_next_analyzer++]->analyze(m_location);
                if (m_current) {
                    return true;
                }
                continue;
            }
            m_location.reset();
            if (m_queue.empty()) {
                return false;
            }
            auto location = std::move(m_queue.front());
            m_queue.pop_front();
            if (location->is_directory()) {
                expand(location);
                continue;
            }
            m_location = std::move(location);
            m_next_analyzer = 0;
        }
    }

    void expand(const ScanLocationPtr& directory)
    {
        for (auto& path : list_regular_files(directory->path())) {
            m_queue.push_back(directory->create_child(std::move(path)));
        }
    }

    const Config& m_config;
    std::vector<AnalyzerPtr> m_analyzers;
    std::deque<ScanLocationPtr> m_queue;
    ScanLocationPtr m_location;
    std::size_t m_next_analyzer = 0;
    OutputStreamPtr m_current;
};

}  // namespace

VectorStream::VectorStream(std::vector<ScanOutput> items)
    : m_items(std::move(items))
{}

std::optional<ScanOutput> VectorStream::next()
{
    if (m_next >= m_items.size()) {
        return std::nullopt;
    }
    return std::move(m_items[m_next++]);
}

Pipeline::Pipeline(const Config& config, std::vector<AnalyzerPtr> analyzers)
    : m_config(config)
    , m_analyzers(std::move(analyzers))
{}

OutputStreamPtr Pipeline::analyze(ScanLocationPtr root) const
{
    return std::make_unique<PipelineStream>(m_config, m_analyzers, std::move(root));
}

std::vector<ScanOutput> Pipeline::collect(ScanLocationPtr root) const
{
    std::vector<ScanOutput> outputs;
    auto stream = analyze(std::move(root));
    while (auto item = stream->next()) {
        outputs.push_back(std::move(*item));
    }
    return outputs;
}

std::vector<std::filesystem::path> list_regular_files(const std::filesystem::path& directory)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Failed to list directory '{}': {}", directory.string(), ec.message());
        return files;
    }
    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Failed to list directory '{}': {}", directory.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        if (entry.is_symlink(ec)) {
            continue;
        }
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files);
    return files;
}

}  // namespace pkgaudit::scan
