#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"

#include <memory>

namespace fileops::progress {

class Tracker;

// Periodically re-broadcasts live operations and evicts finished ones past retention.
class Reporter final : public services::AsyncService {
public:
    Reporter(std::shared_ptr<Tracker> tracker, const config::ProgressConfig& cfg);
    ~Reporter() override;

protected:
    void runLoop() override;

private:
    std::shared_ptr<Tracker> tracker_;
    std::chrono::milliseconds interval_;
    std::chrono::minutes retention_;
};

}
