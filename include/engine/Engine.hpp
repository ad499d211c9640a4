#pragma once

#include "types/OperationConfig.hpp"
#include "types/OperationResult.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fileops::concurrency { class Context; }
namespace fileops::fs { class Filesystem; }
namespace fileops::progress { class Tracker; }

namespace fileops::engine {

class Operation;
class OperationFactory;

class Engine {
public:
    // Null collaborators are replaced by a LocalFilesystem and a fresh progress::Tracker,
    // both configured from ConfigRegistry when it is initialized.
    explicit Engine(std::shared_ptr<fs::Filesystem> fs = nullptr,
                    std::shared_ptr<progress::Tracker> tracker = nullptr);

    // Installs or replaces the factory for a kind
    void registerOperation(types::OperationType type, std::shared_ptr<OperationFactory> factory);

    // Validates, creates and runs one operation on the calling thread.
    types::OperationResult executeOperation(const concurrency::Context& ctx,
                                            types::OperationType type,
                                            const types::OperationConfig& config);

    // Lookup, validation, id generation and creation. No side effects beyond the id counter.
    std::shared_ptr<Operation> prepareOperation(types::OperationType type, const types::OperationConfig& config);

    // Starts a tracker, binds it and executes. Rethrows whatever the operation throws
    // after marking the tracker Cancelled or Failed.
    types::OperationResult runOperation(const concurrency::Context& ctx,
                                        const std::shared_ptr<Operation>& op,
                                        const types::OperationConfig& config);

    [[nodiscard]] std::vector<types::OperationType> supportedOperations() const;
    [[nodiscard]] bool supports(types::OperationType type) const;

    [[nodiscard]] const std::shared_ptr<progress::Tracker>& progressTracker() const { return tracker_; }
    [[nodiscard]] const std::shared_ptr<fs::Filesystem>& filesystem() const { return fs_; }

    std::string generateOperationId(types::OperationType type);

private:
    std::shared_ptr<fs::Filesystem> fs_;
    std::shared_ptr<progress::Tracker> tracker_;

    mutable std::shared_mutex mu_;
    std::map<types::OperationType, std::shared_ptr<OperationFactory>> factories_;

    std::atomic<uint64_t> seq_{0};

    void registerBuiltins();
};

}
