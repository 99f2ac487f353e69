#include "lendcore/ranking/ranking_heap.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lendcore {
namespace ranking {

void RankingHeap::update(common::UserId user,
                         const common::Amount& former_value,
                         const common::Amount& new_value,
                         std::size_t max_sorted_size) {
  if (max_sorted_size == 0) {
    throw std::invalid_argument("ranking: max sorted size must be positive");
  }
  if (value_of(user) != former_value) {
    throw std::invalid_argument("ranking: former value does not match stored value");
  }

  sorted_size_ = compute_size(sorted_size_, max_sorted_size);

  if (former_value == new_value) {
    return;
  }
  if (new_value == 0) {
    remove(user, former_value);
  } else if (former_value == 0) {
    insert(user, new_value);
  } else if (former_value < new_value) {
    increase(user, new_value);
  } else {
    decrease(user, new_value);
  }
}

common::UserId RankingHeap::head() const noexcept {
  if (slots_.empty()) {
    return common::kNoUser;
  }
  return slots_.front().user;
}

common::Amount RankingHeap::value_of(common::UserId user) const {
  if (auto it = slot_of_.find(user); it != slot_of_.end()) {
    return slots_[it->second].value;
  }
  return 0;
}

bool RankingHeap::contains(common::UserId user) const noexcept {
  return slot_of_.find(user) != slot_of_.end();
}

std::vector<RankingHeap::Entry> RankingHeap::descending() const {
  std::vector<Entry> entries = slots_;
  std::sort(entries.begin(), entries.end(), [](const Entry& lhs, const Entry& rhs) {
    if (lhs.value != rhs.value) {
      return lhs.value > rhs.value;
    }
    return lhs.user < rhs.user;
  });
  return entries;
}

std::size_t RankingHeap::compute_size(std::size_t size, std::size_t max_sorted_size) noexcept {
  while (size >= max_sorted_size) {
    size >>= 1;
  }
  return size;
}

void RankingHeap::insert(common::UserId user, const common::Amount& value) {
  if (user == common::kNoUser) {
    throw std::invalid_argument("ranking: cannot insert the zero user");
  }

  const std::size_t length = slots_.size();
  slots_.push_back(Entry{.user = user, .value = value});
  slot_of_[user] = length;

  // The first unsorted entry goes to the back so the new one can join the heap.
  if (sorted_size_ != length) {
    swap_slots(sorted_size_, length);
  }
  shift_up(sorted_size_++);
}

void RankingHeap::remove(common::UserId user, const common::Amount& removed_value) {
  const std::size_t index = slot_of_.at(user);
  const std::size_t length = slots_.size();

  swap_slots(index, length - 1);
  if (sorted_size_ == length) {
    --sorted_size_;
  }
  slots_.pop_back();
  slot_of_.erase(user);

  if (index < sorted_size_) {
    if (removed_value > slots_[index].value) {
      shift_down(index);
    } else {
      shift_up(index);
    }
  }
}

void RankingHeap::increase(common::UserId user, const common::Amount& new_value) {
  const std::size_t index = slot_of_.at(user);
  slots_[index].value = new_value;

  if (index < sorted_size_) {
    shift_up(index);
  } else {
    swap_slots(sorted_size_, index);
    shift_up(sorted_size_++);
  }
}

void RankingHeap::decrease(common::UserId user, const common::Amount& new_value) {
  const std::size_t index = slot_of_.at(user);
  slots_[index].value = new_value;

  // Leaves of the heap and unsorted entries need no reordering.
  if (index < sorted_size_ / 2) {
    shift_down(index);
  }
}

void RankingHeap::swap_slots(std::size_t first, std::size_t second) {
  if (first == second) {
    return;
  }
  std::swap(slots_[first], slots_[second]);
  slot_of_[slots_[first].user] = first;
  slot_of_[slots_[second].user] = second;
}

void RankingHeap::shift_up(std::size_t index) {
  while (index > 0) {
    const std::size_t parent = (index - 1) / 2;
    if (slots_[parent].value >= slots_[index].value) {
      break;
    }
    swap_slots(parent, index);
    index = parent;
  }
}

void RankingHeap::shift_down(std::size_t index) {
  for (;;) {
    std::size_t child = 2 * index + 1;
    if (child >= sorted_size_) {
      break;
    }
    if (child + 1 < sorted_size_ && slots_[child + 1].value > slots_[child].value) {
      ++child;
    }
    if (slots_[child].value <= slots_[index].value) {
      break;
    }
    swap_slots(index, child);
    index = child;
  }
}

}  // namespace ranking
}  // namespace lendcore
