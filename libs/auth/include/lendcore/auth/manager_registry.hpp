#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <utility>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace auth {

// Decides whether `caller` may act on the positions of `owner`.
class PermissionResolver {
 public:
  virtual ~PermissionResolver() = default;

  [[nodiscard]] virtual bool is_allowed(common::UserId owner, common::UserId caller) const = 0;
};

// Delegation table. A user always manages their own positions; other callers
// need an explicit approval from the owner.
class ManagerRegistry final : public PermissionResolver {
 public:
  // Grants or revokes `manager` on the positions of `owner`.
  void approve_manager(common::UserId owner, common::UserId manager, bool approved);

  [[nodiscard]] bool is_managed_by(common::UserId owner, common::UserId manager) const;
  [[nodiscard]] bool is_allowed(common::UserId owner, common::UserId caller) const override;

  [[nodiscard]] std::size_t approval_count() const;

 private:
  mutable std::mutex mutex_;
  std::set<std::pair<common::UserId, common::UserId>> approvals_;
};

}  // namespace auth
}  // namespace lendcore
