#include "engine/ops/Deduplication.hpp"
#include "fs/Filesystem.hpp"
#include "progress/OperationTracker.hpp"
#include "concurrency/Context.hpp"
#include "concurrency/Task.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/glob.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <latch>
#include <map>
#include <ranges>
#include <mutex>
#include <sys/stat.h>
#include <fmt/format.h>

using namespace fileops::engine::ops;
using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::util;
using namespace fileops::log;

namespace {

struct Candidate {
    std::filesystem::path path;
    uintmax_t size;
};

bool withinSizeLimits(const uintmax_t size, const OperationConfig& config) {
    if (config.min_file_size > 0 && size < static_cast<uintmax_t>(config.min_file_size)) return false;
    if (config.max_file_size > 0 && size > static_cast<uintmax_t>(config.max_file_size)) return false;
    return true;
}

struct HashTask final : Task {
    std::function<void()> fn;
    explicit HashTask(std::function<void()> f) : fn(std::move(f)) {}
    void operator()() override { fn(); }
};

// parallelism from the operation config, else performance.max_workers
unsigned int hashWorkers(const OperationConfig& config, const size_t candidates) {
    unsigned int n = 0;
    if (config.parallelism > 0) n = static_cast<unsigned int>(config.parallelism);
    else if (fileops::config::ConfigRegistry::isInitialized()) n = fileops::config::ConfigRegistry::get().effectiveMaxWorkers();
    else n = fileops::config::Config{}.effectiveMaxWorkers();
    return static_cast<unsigned int>(std::min<size_t>(n, candidates));
}

std::string effectiveAlgorithm(const OperationConfig& config) {
    if (!config.hash_algorithm.empty()) return config.hash_algorithm;
    if (fileops::config::ConfigRegistry::isInitialized()) return fileops::config::ConfigRegistry::get().operations.hash_algorithm;
    return fileops::config::OperationsConfig{}.hash_algorithm;
}

}

void fileops::engine::ops::to_json(nlohmann::json& j, const DuplicateGroup& g) {
    j = {
        {"hash", g.hash},
        {"size", g.size},
        {"files", g.files}
    };
}

DeduplicationOperation::DeduplicationOperation(std::string id, OperationConfig config, std::shared_ptr<fs::Filesystem> fs)
    : BaseOperation(std::move(id), OperationType::Deduplication, std::move(config), std::move(fs)) {}

OperationResult DeduplicationOperation::execute(const Context& ctx, const OperationConfig& config) {
    const auto algorithm = effectiveAlgorithm(config);

    updateStep("Scanning files");

    std::map<uintmax_t, std::vector<std::filesystem::path>> bySize;
    for (const auto& pattern : config.include_patterns) {
        fs_->walk(ctx, trimTrailingSeparator(pattern), [&](const std::filesystem::path& path,
                                                           const fs::model::FileInfo* info,
                                                           const std::error_code& ec) {
            if (ec) {
                addError(fmt::format("error walking {}: {}", path.string(), ec.message()));
                return;
            }

            checkContext(ctx);
            incrementProgress(1, 0);

            if (!info || !S_ISREG(info->mode) || info->size == 0) return;
            if (anyGlobMatch(config.exclude_patterns, info->name)) return;
            if (!withinSizeLimits(info->size, config)) return;

            bySize[info->size].push_back(path);
        });
    }

    updateStep("Grouping by size");

    std::vector<Candidate> candidates;
    int64_t candidateBytes = 0;
    for (const auto& [size, paths] : bySize) {
        if (paths.size() < 2) continue;
        for (const auto& p : paths) {
            candidates.push_back({p, size});
            candidateBytes += static_cast<int64_t>(size);
        }
    }

    if (const auto t = tracker())
        setTotals(t->itemsProcessed() + static_cast<int64_t>(candidates.size()), candidateBytes);

    updateStep("Hashing candidates");

    // (size, digest) -> files
    std::map<std::pair<uintmax_t, std::string>, std::vector<std::string>> byHash;
    std::mutex resultsMu;
    std::atomic<size_t> next{0};
    std::exception_ptr failure;

    const auto hashCandidates = [&] {
        try {
            for (size_t i = next++; i < candidates.size(); i = next++) {
                checkContext(ctx);
                const auto& c = candidates[i];

                try {
                    auto digest = fs_->computeHash(c.path, algorithm);
                    std::scoped_lock lock(resultsMu);
                    byHash[{c.size, std::move(digest)}].push_back(c.path.string());
                } catch (const std::exception& e) {
                    addError(fmt::format("failed to hash {}: {}", c.path.string(), e.what()));
                }

                incrementProgress(1, static_cast<int64_t>(c.size));
            }
        } catch (const std::exception&) {
            // cancellation or deadline: stop the other workers and rethrow on the caller's thread
            std::scoped_lock lock(resultsMu);
            if (!failure) failure = std::current_exception();
            next = candidates.size();
        }
    };

    if (const auto workers = hashWorkers(config, candidates.size()); workers <= 1) {
        hashCandidates();
    } else {
        Registry::engine()->debug("[Deduplication] Hashing {} candidates on {} workers", candidates.size(), workers);
        std::latch done(workers);
        ThreadPool pool(workers, "DedupHash");
        for (unsigned int i = 0; i < workers; ++i)
            pool.submit(std::make_shared<HashTask>([&] {
                hashCandidates();
                done.count_down();
            }));
        done.wait();
    }

    if (failure) std::rethrow_exception(failure);

    // completion order varies across workers
    for (auto& files : byHash | std::views::values) std::ranges::sort(files);

    updateStep("Grouping duplicates");

    for (auto& [key, files] : byHash) {
        if (files.size() < 2) continue;
        const auto& [size, digest] = key;
        totalSize_ += size * files.size();
        saveableSize_ += size * (files.size() - 1);
        duplicateGroups_.push_back({digest, size, std::move(files)});
    }

    updateStep("Completed");

    nlohmann::json details = {
        {"duplicate_groups", duplicateGroups_.size()},
        {"groups", duplicateGroups_},
        {"total_size", totalSize_},
        {"saveable_size", saveableSize_},
        {"hash_algorithm", algorithm},
        {"dry_run", config.dry_run}
    };

    const auto summary = fmt::format("Deduplication scan completed: {} duplicate groups, {} bytes reclaimable",
                                     duplicateGroups_.size(), saveableSize_);

    Registry::engine()->info("[Deduplication] {}", summary);

    return createResult(OperationStatus::Completed, summary, std::move(details));
}

ProgressInfo DeduplicationOperation::estimateProgress(const OperationConfig&) const {
    return pendingEstimate(TOTAL_STEPS, 1000);
}

std::shared_ptr<Operation> DeduplicationFactory::create(const std::string& id, const OperationConfig& config) {
    return std::make_shared<DeduplicationOperation>(id, config, fs_);
}
