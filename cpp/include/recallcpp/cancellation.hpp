#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace recallcpp {

class CancellationToken {
 public:
  // A default token is never cancelled.
  CancellationToken() = default;

  [[nodiscard]] bool IsCancelled() const;
  void ThrowIfCancelled(const std::string& context) const;

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag);

  std::shared_ptr<const std::atomic<bool>> flag_{};
};

class CancellationSource {
 public:
  CancellationSource();

  void Cancel();
  [[nodiscard]] bool IsCancelled() const;
  [[nodiscard]] CancellationToken token() const;

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace recallcpp
