#include "lendcore/auth/manager_registry.hpp"

#include <stdexcept>

namespace lendcore {
namespace auth {

void ManagerRegistry::approve_manager(common::UserId owner, common::UserId manager, bool approved) {
  if (owner == common::kNoUser || manager == common::kNoUser) {
    throw std::invalid_argument("auth: zero user in manager approval");
  }

  std::scoped_lock lock(mutex_);
  if (approved) {
    approvals_.emplace(owner, manager);
  } else {
    approvals_.erase({owner, manager});
  }
}

bool ManagerRegistry::is_managed_by(common::UserId owner, common::UserId manager) const {
  std::scoped_lock lock(mutex_);
  return approvals_.contains({owner, manager});
}

bool ManagerRegistry::is_allowed(common::UserId owner, common::UserId caller) const {
  if (caller == common::kNoUser) {
    return false;
  }
  return owner == caller || is_managed_by(owner, caller);
}

std::size_t ManagerRegistry::approval_count() const {
  std::scoped_lock lock(mutex_);
  return approvals_.size();
}

}  // namespace auth
}  // namespace lendcore
