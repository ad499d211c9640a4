#pragma once

namespace fileops::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
