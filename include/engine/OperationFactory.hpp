#pragma once

#include "types/OperationConfig.hpp"

#include <memory>
#include <string>

namespace fileops::fs { class Filesystem; }

namespace fileops::engine {

class Operation;

class OperationFactory {
public:
    explicit OperationFactory(std::shared_ptr<fs::Filesystem> fs) : fs_(std::move(fs)) {}
    virtual ~OperationFactory() = default;

    // Throws InvalidConfiguration. Overrides call the base first.
    virtual void validate(const types::OperationConfig& config) const;

    virtual std::shared_ptr<Operation> create(const std::string& id, const types::OperationConfig& config) = 0;

protected:
    std::shared_ptr<fs::Filesystem> fs_;
};

}
