#include "engine/OperationFactory.hpp"
#include "engine/errors.hpp"

using namespace fileops::engine;

void OperationFactory::validate(const types::OperationConfig& config) const {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        throw InvalidConfiguration(e.what());
    }
}
