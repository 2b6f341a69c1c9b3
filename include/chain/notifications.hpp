// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "util/uint.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace strata {
namespace validation {

// Event values are snapshots; they hold no pointers into the block tree.

struct BlockConnectedEvent {
  uint256 hash;
  int height;
  chain::Timestamp time;
};

struct BlockDisconnectedEvent {
  uint256 hash;
  int height;
};

struct ChainTipEvent {
  uint256 hash;
  int height;
  // Blocks disconnected to reach this tip; 0 when the chain only grew.
  int reorg_depth;
};

/**
 * ChainNotifications - observers of one ChainstateManager.
 *
 * Callbacks run synchronously on the thread that changed the chain, after
 * the validation lock has been released, so they may query the manager.
 * Each Subscribe call returns an RAII handle that unsubscribes on
 * destruction.
 */
class ChainNotifications {
public:
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void Unsubscribe();

  private:
    friend class ChainNotifications;
    Subscription(ChainNotifications* owner, size_t id) : owner_(owner), id_(id) {}

    ChainNotifications* owner_{nullptr};
    size_t id_{0};
  };

  using BlockConnectedCallback = std::function<void(const BlockConnectedEvent&)>;
  using BlockDisconnectedCallback = std::function<void(const BlockDisconnectedEvent&)>;
  using ChainTipCallback = std::function<void(const ChainTipEvent&)>;
  using FatalErrorCallback = std::function<void(const std::string& message)>;

  ChainNotifications() = default;
  ChainNotifications(const ChainNotifications&) = delete;
  ChainNotifications& operator=(const ChainNotifications&) = delete;

  [[nodiscard]] Subscription SubscribeBlockConnected(BlockConnectedCallback callback);
  [[nodiscard]] Subscription SubscribeBlockDisconnected(BlockDisconnectedCallback callback);
  [[nodiscard]] Subscription SubscribeChainTip(ChainTipCallback callback);
  [[nodiscard]] Subscription SubscribeFatalError(FatalErrorCallback callback);

  void NotifyBlockConnected(const BlockConnectedEvent& event);
  void NotifyBlockDisconnected(const BlockDisconnectedEvent& event);
  void NotifyChainTip(const ChainTipEvent& event);
  void NotifyFatalError(const std::string& message);

  size_t SubscriberCount() const;

private:
  using Callback = std::variant<BlockConnectedCallback, BlockDisconnectedCallback, ChainTipCallback, FatalErrorCallback>;

  struct CallbackEntry {
    size_t id;
    Callback callback;
  };

  Subscription Add(Callback callback);
  void Unsubscribe(size_t id);

  template <typename F, typename... Args>
  void Dispatch(const Args&... args);

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};  // 0 reserved for invalid
};

}  // namespace validation
}  // namespace strata
