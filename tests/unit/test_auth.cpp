#include "test_auth.hpp"

#include <cassert>
#include <stdexcept>

#include "lendcore/auth/manager_registry.hpp"

namespace lendcore::tests {

void test_manager_registry() {
  auth::ManagerRegistry registry;

  // Owners always act for themselves.
  assert(registry.is_allowed(1, 1));
  assert(!registry.is_allowed(1, 2));
  assert(!registry.is_allowed(1, common::kNoUser));

  registry.approve_manager(1, 2, true);
  assert(registry.is_managed_by(1, 2));
  assert(registry.is_allowed(1, 2));
  assert(!registry.is_allowed(2, 1));
  assert(registry.approval_count() == 1);

  // Approving twice keeps one entry.
  registry.approve_manager(1, 2, true);
  assert(registry.approval_count() == 1);

  registry.approve_manager(1, 2, false);
  assert(!registry.is_allowed(1, 2));
  assert(registry.approval_count() == 0);

  bool threw = false;
  try {
    registry.approve_manager(common::kNoUser, 2, true);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace lendcore::tests
