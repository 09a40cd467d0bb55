#pragma once

#include <tessera/result.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace tessera {

// Cooperative cancellation flag shared between a caller and the operations
// it started. Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Returns Cancelled when `token` is set; a null token is never cancelled.
inline Status check_cancelled(const CancelToken* token, const std::string& what) {
    if (token && token->is_cancelled()) {
        return TesseraError(TesseraError::Cancelled, what + " was cancelled");
    }
    return ok_status();
}

} // namespace tessera
