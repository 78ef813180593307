#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "conditions/condition_node.hpp"
#include "engine/device_event_router.hpp"
#include "timing/timer_service.hpp"

namespace rules_engine {

using hub_rules::Duration;
using hub_rules::TimePoint;

// Invoked once, outside the engine lock, when a tree fires or times out
using ConditionSignal = std::function<void()>;

// How add_condition treats the state a tree has at registration
struct ArmOptions {
  // A root that already holds is ignored until it goes false and true again
  bool edge_only = false;
  // When set, the tree is primed with it under the engine lock, so no event
  // can fall between the read and the leaf subscriptions
  AttributeReader prime_with;
};

/**
 * @brief Registry of live condition trees and the propagation algorithm.
 *
 * Each registered tree ends in exactly one of three ways: it fires (root
 * became true, held for the optional duration), it times out, or it is
 * removed explicitly. The first two deliver the matching signal and
 * deregister the tree; removal delivers nothing.
 *
 * A root that already holds at registration fires during add_condition, or
 * starts its duration right away. With ArmOptions::edge_only it is ignored
 * instead until it goes false and true again.
 *
 * Thread Safety:
 *   Registry mutation, propagation and timer races run under one mutex.
 *   Signals are delivered after the mutex is released, so a signal handler
 *   may call straight back into the engine.
 */
class RuleEngine {
public:
  explicit RuleEngine(rules_timing::TimerService &timers);
  ~RuleEngine();

  RuleEngine(const RuleEngine &) = delete;
  RuleEngine &operator=(const RuleEngine &) = delete;

  /**
   * @brief Register a tree and index its leaves by device id.
   *
   * Does not fetch values itself; the caller primes the tree beforehand or
   * hands a reader in ArmOptions::prime_with. Relative timeout/duration are
   * turned into deadlines from a single clock read.
   *
   * If the root already holds and no duration is configured, the tree is
   * never indexed and `fired` runs before this returns.
   *
   * @throws hub_rules::DuplicateError if any node of the tree is registered
   * @throws hub_rules::TimerError if the timeout timer cannot be scheduled
   *         (the tree is not registered in that case)
   * Reader failures from prime_with propagate; nothing is registered then.
   */
  void add_condition(const ConditionNode::Ptr &root, ConditionSignal fired,
                     ConditionSignal timed_out,
                     std::optional<Duration> timeout = std::nullopt,
                     std::optional<Duration> for_duration = std::nullopt,
                     const ArmOptions &options = ArmOptions());

  /**
   * @brief Cached state of any registered node.
   *
   * A root with a duration configured reads false until it fires.
   *
   * @throws hub_rules::NotFoundError if the node is not registered
   */
  bool get_condition_state(const ConditionNode &node) const;

  /**
   * @brief Cancel the tree's timers, drop its subscriptions, deregister it.
   *
   * @throws hub_rules::NotFoundError if node is not a registered root
   */
  void remove_condition(const ConditionNode &root);

  // Remove without throwing; returns false if the root was not registered
  bool try_remove_condition(const ConditionNode &root);

  // Route one hub event through the interested leaves and their ancestors
  void on_device_event(const DeviceEvent &event);

  bool is_registered(const ConditionNode &node) const;
  size_t tree_count() const;

  // Deregister everything without delivering signals
  void clear();

private:
  struct Tree {
    ConditionNode::Ptr root;
    ConditionSignal fired;
    ConditionSignal timed_out;
    std::optional<Duration> for_duration;
    uint64_t registration = 0;
    rules_timing::TimerHandle timeout_timer = rules_timing::kInvalidTimer;
    rules_timing::TimerHandle duration_timer = rules_timing::kInvalidTimer;
    uint64_t duration_token = 0;
  };

  struct NodeEntry {
    ConditionNode *node = nullptr;
    ConditionNode *parent = nullptr;
    ConditionId root = 0;
  };

  enum class Outcome { Fired, TimedOut };

  // All private helpers expect mutex_ held
  void index_tree(const ConditionNode::Ptr &node, ConditionNode *parent,
                  ConditionId root);
  void deindex_tree(const ConditionNode::Ptr &node);
  Tree detach_tree(std::map<ConditionId, Tree>::iterator it);
  void finish(ConditionId root, Outcome outcome,
              std::vector<ConditionSignal> &signals);
  void start_duration_timer(Tree &tree, TimePoint now);
  void on_root_changed(Tree &tree, bool was_true, TimePoint now,
                       std::vector<ConditionSignal> &signals);

  void on_timeout_elapsed(ConditionId root, uint64_t registration);
  void on_duration_elapsed(ConditionId root, uint64_t registration,
                           uint64_t token);

  static void deliver(std::vector<ConditionSignal> &signals);

  rules_timing::TimerService &timers_;

  std::map<ConditionId, Tree> trees_; // keyed by root id
  std::unordered_map<ConditionId, NodeEntry> nodes_;
  DeviceEventRouter router_;
  uint64_t next_registration_ = 1;

  mutable std::mutex mutex_;
};

} // namespace rules_engine
