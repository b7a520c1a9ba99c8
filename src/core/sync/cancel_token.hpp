#pragma once

#include <atomic>
#include <memory>

namespace crew::core::sync {

// A null token is never cancelled.
using CancelToken = std::shared_ptr<std::atomic_bool>;

inline CancelToken make_cancel_token() {
    return std::make_shared<std::atomic_bool>(false);
}

inline bool is_cancelled(const CancelToken& token) {
    return token && token->load();
}

inline void cancel(const CancelToken& token) {
    if (token) {
        token->store(true);
    }
}

}  // namespace crew::core::sync
