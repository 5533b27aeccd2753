#include "recallcpp/cancellation.hpp"
#include "recallcpp/errors.hpp"

#include <utility>

namespace recallcpp {

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<bool>> flag) : flag_(std::move(flag)) {}

bool CancellationToken::IsCancelled() const {
  return flag_ != nullptr && flag_->load(std::memory_order_acquire);
}

void CancellationToken::ThrowIfCancelled(const std::string& context) const {
  if (IsCancelled()) {
    throw CancelledError(context + ": cancelled by caller");
  }
}

CancellationSource::CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationSource::Cancel() {
  flag_->store(true, std::memory_order_release);
}

bool CancellationSource::IsCancelled() const {
  return flag_->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
  return CancellationToken(flag_);
}

}  // namespace recallcpp
