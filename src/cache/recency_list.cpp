#include "cache/recency_list.h"

namespace memoflow {
namespace cache {

void RecencyList::promote(Handle handle) {
  if (handle >= links_.size()) {
    links_.resize(handle + 1);
  }

  if (links_[handle].linked) {
    if (head_ == handle) {
      return;
    }
    unlink(handle);
  }

  Links &node = links_[handle];
  node.closer = kNone;
  node.further = head_;
  node.linked = true;

  if (head_ != kNone) {
    links_[head_].closer = handle;
  } else {
    tail_ = handle;
  }
  head_ = handle;
  ++length_;
}

void RecencyList::remove(Handle handle) {
  if (!contains(handle)) {
    return;
  }
  unlink(handle);
}

bool RecencyList::contains(Handle handle) const {
  return handle < links_.size() && links_[handle].linked;
}

std::optional<RecencyList::Handle> RecencyList::least_recent() const {
  if (tail_ == kNone) {
    return std::nullopt;
  }
  return tail_;
}

std::optional<RecencyList::Handle> RecencyList::most_recent() const {
  if (head_ == kNone) {
    return std::nullopt;
  }
  return head_;
}

std::vector<RecencyList::Handle> RecencyList::snapshot() const {
  std::vector<Handle> order;
  order.reserve(length_);
  for (Handle h = head_; h != kNone; h = links_[h].further) {
    order.push_back(h);
  }
  return order;
}

void RecencyList::clear() {
  links_.clear();
  head_ = kNone;
  tail_ = kNone;
  length_ = 0;
}

void RecencyList::unlink(Handle handle) {
  Links &node = links_[handle];

  if (node.closer != kNone) {
    links_[node.closer].further = node.further;
  } else {
    head_ = node.further;
  }

  if (node.further != kNone) {
    links_[node.further].closer = node.closer;
  } else {
    tail_ = node.closer;
  }

  node.closer = kNone;
  node.further = kNone;
  node.linked = false;
  --length_;
}

} // namespace cache
} // namespace memoflow
