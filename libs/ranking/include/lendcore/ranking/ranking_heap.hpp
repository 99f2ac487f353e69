#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ranking {

// Users ordered by balance, with the current maximum at the head.
//
// Entries live in a contiguous slot arena addressed by a user -> slot map, so
// updates and removals never chase pointers. Only the first `sorted_size_` slots
// form a binary max-heap; entries past it are kept unsorted. Once the sorted
// part reaches `max_sorted_size` it is halved, which bounds the cost of an
// update while keeping the largest balances near the head.
class RankingHeap {
 public:
  struct Entry {
    common::UserId user{common::kNoUser};
    common::Amount value{0};
  };

  // Moves `user` from `former_value` to `new_value`. A zero value means absent:
  // 0 -> x inserts, x -> 0 removes. Throws std::invalid_argument when
  // `former_value` does not match the stored value.
  void update(common::UserId user,
              const common::Amount& former_value,
              const common::Amount& new_value,
              std::size_t max_sorted_size);

  [[nodiscard]] common::UserId head() const noexcept;
  [[nodiscard]] common::Amount value_of(common::UserId user) const;
  [[nodiscard]] bool contains(common::UserId user) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }
  [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }
  [[nodiscard]] std::size_t sorted_size() const noexcept { return sorted_size_; }

  // All entries by descending value (ties by ascending user id).
  [[nodiscard]] std::vector<Entry> descending() const;

 private:
  std::vector<Entry> slots_{};
  std::unordered_map<common::UserId, std::size_t> slot_of_{};
  std::size_t sorted_size_{0};

  static std::size_t compute_size(std::size_t size, std::size_t max_sorted_size) noexcept;

  void insert(common::UserId user, const common::Amount& value);
  void remove(common::UserId user, const common::Amount& removed_value);
  void increase(common::UserId user, const common::Amount& new_value);
  void decrease(common::UserId user, const common::Amount& new_value);

  void swap_slots(std::size_t first, std::size_t second);
  void shift_up(std::size_t index);
  void shift_down(std::size_t index);
};

}  // namespace ranking
}  // namespace lendcore
