#pragma once

#include <atomic>

#include "placement/Errors.hpp"

namespace placement {

class CancelToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool cancelled() const { return m_cancelled.load(); }

    void throw_if_cancelled() const {
        if (cancelled()) throw RoundCancelled();
    }

private:
    std::atomic<bool> m_cancelled{false};
};

}  // namespace placement
