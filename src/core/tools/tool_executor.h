#pragma once

#include "core/query/query_normalizer.h"
#include "core/shared/types.h"

#include <atomic>
#include <memory>

namespace rw {

// Cooperative cancellation flag. Copies share the same flag, so a token
// handed to a tool can be tripped by whoever kept the original.
class CancelToken {
public:
    CancelToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

// ToolExecutor -- abstract interface for the domain tools (institutions,
// hospitals, restaurants) and the web-search provider.
//
// The router owns one executor per tool name, resolved at construction.
// run() may be invoked on a worker thread when a timeout is in force;
// implementations should poll the token during long work and return
// promptly once it is cancelled. Throwing std::exception is allowed and is
// reported to the caller as a failed execution.
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    virtual ExecutionOutcome run(const NormalizedQuery& query, const CancelToken& cancel) = 0;
};

} // namespace rw
