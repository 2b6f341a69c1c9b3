// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/notifications.hpp"

#include <algorithm>

namespace strata {
namespace validation {

// ============================================================================
// ChainNotifications::Subscription
// ============================================================================

ChainNotifications::Subscription::~Subscription() {
  Unsubscribe();
}

ChainNotifications::Subscription::Subscription(Subscription&& other) noexcept : owner_(other.owner_), id_(other.id_) {
  other.owner_ = nullptr;
}

ChainNotifications::Subscription& ChainNotifications::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    other.owner_ = nullptr;
  }
  return *this;
}

void ChainNotifications::Subscription::Unsubscribe() {
  if (owner_) {
    owner_->Unsubscribe(id_);
    owner_ = nullptr;
  }
}

// ============================================================================
// ChainNotifications
// ============================================================================

ChainNotifications::Subscription ChainNotifications::Add(Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t id = next_id_++;
  callbacks_.push_back(CallbackEntry{id, std::move(callback)});
  return Subscription(this, id);
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockConnected(BlockConnectedCallback callback) {
  return Add(std::move(callback));
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockDisconnected(BlockDisconnectedCallback callback) {
  return Add(std::move(callback));
}

ChainNotifications::Subscription ChainNotifications::SubscribeChainTip(ChainTipCallback callback) {
  return Add(std::move(callback));
}

ChainNotifications::Subscription ChainNotifications::SubscribeFatalError(FatalErrorCallback callback) {
  return Add(std::move(callback));
}

template <typename F, typename... Args>
void ChainNotifications::Dispatch(const Args&... args) {
  // Copy out under the lock; a callback may subscribe or unsubscribe.
  std::vector<F> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
      if (const F* cb = std::get_if<F>(&entry.callback); cb && *cb) {
        snapshot.push_back(*cb);
      }
    }
  }
  for (const auto& callback : snapshot) {
    callback(args...);
  }
}

void ChainNotifications::NotifyBlockConnected(const BlockConnectedEvent& event) {
  Dispatch<BlockConnectedCallback>(event);
}

void ChainNotifications::NotifyBlockDisconnected(const BlockDisconnectedEvent& event) {
  Dispatch<BlockDisconnectedCallback>(event);
}

void ChainNotifications::NotifyChainTip(const ChainTipEvent& event) {
  Dispatch<ChainTipCallback>(event);
}

void ChainNotifications::NotifyFatalError(const std::string& message) {
  Dispatch<FatalErrorCallback>(message);
}

size_t ChainNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void ChainNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(callbacks_.begin(), callbacks_.end(), [id](const CallbackEntry& e) { return e.id == id; });
  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

}  // namespace validation
}  // namespace strata
