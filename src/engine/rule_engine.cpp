#include "engine/rule_engine.hpp"

#include <exception>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace rules_engine {

using rules_timing::kInvalidTimer;

// A failing node is treated as unchanged for this event
static std::optional<bool> recompute_isolated(ConditionNode &node,
                                              const DeviceEvent &event) {
  try {
    return node.recompute(event);
  } catch (const std::exception &e) {
    std::cerr << "[RuleEngine] Recompute of '" << node.describe()
              << "' failed: " << e.what() << std::endl;
    return std::nullopt;
  }
}

RuleEngine::RuleEngine(rules_timing::TimerService &timers) : timers_(timers) {}

RuleEngine::~RuleEngine() { clear(); }

// -----------------------------
// Public API
// -----------------------------

void RuleEngine::add_condition(const ConditionNode::Ptr &root,
                               ConditionSignal fired,
                               ConditionSignal timed_out,
                               std::optional<Duration> timeout,
                               std::optional<Duration> for_duration,
                               const ArmOptions &options) {
  if (!root) {
    throw std::invalid_argument("add_condition: null condition");
  }
  if (for_duration && *for_duration <= Duration::zero()) {
    for_duration.reset();
  }

  std::vector<ConditionSignal> signals;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<ConditionId> seen;
    bool duplicate = false;
    for_each_node(root, [&](const ConditionNode::Ptr &node) {
      if (nodes_.count(node->id()) > 0 || !seen.insert(node->id()).second) {
        duplicate = true;
      }
    });
    if (duplicate) {
      throw hub_rules::DuplicateError("Condition '" + root->describe() +
                                      "' is already registered");
    }

    if (options.prime_with) {
      root->prime(options.prime_with);
    }
    const bool holds = root->current_state() && !options.edge_only;

    if (holds && !for_duration) {
      std::cerr << "[RuleEngine] Condition '" << root->describe()
                << "' already holds" << std::endl;
      if (fired) {
        signals.push_back(std::move(fired));
      }
    } else {
      const TimePoint now = timers_.now();
      const ConditionId root_id = root->id();

      Tree tree;
      tree.root = root;
      tree.fired = std::move(fired);
      tree.timed_out = std::move(timed_out);
      tree.for_duration = for_duration;
      tree.registration = next_registration_++;

      if (timeout) {
        const uint64_t registration = tree.registration;
        // Throws TimerError before anything is indexed
        tree.timeout_timer = timers_.schedule_at(
            now + *timeout, [this, root_id, registration]() {
              on_timeout_elapsed(root_id, registration);
            });
      }

      index_tree(root, nullptr, root_id);
      auto it = trees_.emplace(root_id, std::move(tree)).first;

      if (holds) {
        start_duration_timer(it->second, now);
      }
    }
  }

  deliver(signals);
}

bool RuleEngine::get_condition_state(const ConditionNode &node) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(node.id());
  if (it == nodes_.end()) {
    throw hub_rules::NotFoundError("Condition '" + node.describe() +
                                   "' is not registered");
  }
  if (it->second.parent == nullptr) {
    const Tree &tree = trees_.at(node.id());
    if (tree.for_duration) {
      return false;
    }
  }
  return it->second.node->current_state();
}

void RuleEngine::remove_condition(const ConditionNode &root) {
  if (!try_remove_condition(root)) {
    throw hub_rules::NotFoundError("Condition '" + root.describe() +
                                   "' is not a registered root");
  }
}

bool RuleEngine::try_remove_condition(const ConditionNode &root) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = trees_.find(root.id());
  if (it == trees_.end()) {
    return false;
  }
  detach_tree(it);
  return true;
}

void RuleEngine::on_device_event(const DeviceEvent &event) {
  std::vector<ConditionSignal> signals;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto &interested = router_.route(event.device_id);
    if (interested.empty()) {
      return;
    }
    const std::vector<ConditionId> leaves(interested.begin(),
                                          interested.end());

    // Root states before this event, captured before any leaf of the tree
    // is touched
    std::map<ConditionId, bool> roots_before;

    for (ConditionId leaf_id : leaves) {
      auto leaf_it = nodes_.find(leaf_id);
      if (leaf_it == nodes_.end()) {
        continue;
      }
      const NodeEntry &leaf = leaf_it->second;
      if (roots_before.count(leaf.root) == 0) {
        roots_before[leaf.root] = trees_.at(leaf.root).root->current_state();
      }

      if (!recompute_isolated(*leaf.node, event)) {
        continue;
      }

      // Walk up while states keep changing
      ConditionNode *parent = leaf.parent;
      while (parent != nullptr) {
        if (!recompute_isolated(*parent, event)) {
          break;
        }
        parent = nodes_.at(parent->id()).parent;
      }
    }

    const TimePoint now = timers_.now();
    for (const auto &entry : roots_before) {
      auto tree_it = trees_.find(entry.first);
      if (tree_it == trees_.end()) {
        continue;
      }
      if (tree_it->second.root->current_state() != entry.second) {
        on_root_changed(tree_it->second, entry.second, now, signals);
      }
    }
  }

  deliver(signals);
}

bool RuleEngine::is_registered(const ConditionNode &node) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.count(node.id()) > 0;
}

size_t RuleEngine::tree_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trees_.size();
}

void RuleEngine::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  while (!trees_.empty()) {
    detach_tree(trees_.begin());
  }
}

// -----------------------------
// Registry helpers
// -----------------------------

void RuleEngine::index_tree(const ConditionNode::Ptr &node,
                            ConditionNode *parent, ConditionId root) {
  nodes_[node->id()] = NodeEntry{node.get(), parent, root};
  router_.subscribe(*node);
  for (const auto &child : node->children()) {
    index_tree(child, node.get(), root);
  }
}

void RuleEngine::deindex_tree(const ConditionNode::Ptr &node) {
  for_each_node(node, [this](const ConditionNode::Ptr &n) {
    router_.unsubscribe(*n);
    nodes_.erase(n->id());
  });
}

RuleEngine::Tree
RuleEngine::detach_tree(std::map<ConditionId, Tree>::iterator it) {
  Tree tree = std::move(it->second);
  trees_.erase(it);

  if (tree.timeout_timer != kInvalidTimer) {
    timers_.cancel(tree.timeout_timer);
  }
  if (tree.duration_timer != kInvalidTimer) {
    timers_.cancel(tree.duration_timer);
  }
  deindex_tree(tree.root);
  return tree;
}

void RuleEngine::finish(ConditionId root, Outcome outcome,
                        std::vector<ConditionSignal> &signals) {
  auto it = trees_.find(root);
  if (it == trees_.end()) {
    return;
  }
  Tree tree = detach_tree(it);

  if (outcome == Outcome::Fired) {
    std::cerr << "[RuleEngine] Condition '" << tree.root->describe()
              << "' fired" << std::endl;
    if (tree.fired) {
      signals.push_back(std::move(tree.fired));
    }
  } else {
    std::cerr << "[RuleEngine] Condition '" << tree.root->describe()
              << "' timed out" << std::endl;
    if (tree.timed_out) {
      signals.push_back(std::move(tree.timed_out));
    }
  }
}

void RuleEngine::start_duration_timer(Tree &tree, TimePoint now) {
  const ConditionId root_id = tree.root->id();
  const uint64_t registration = tree.registration;
  const uint64_t token = ++tree.duration_token;

  try {
    tree.duration_timer = timers_.schedule_at(
        now + *tree.for_duration, [this, root_id, registration, token]() {
          on_duration_elapsed(root_id, registration, token);
        });
  } catch (const hub_rules::TimerError &e) {
    // Tree stays registered; its timeout (if any) still ends it
    std::cerr << "[RuleEngine] Failed to start duration timer for '"
              << tree.root->describe() << "': " << e.what() << std::endl;
    tree.duration_timer = kInvalidTimer;
  }
}

void RuleEngine::on_root_changed(Tree &tree, bool was_true, TimePoint now,
                                 std::vector<ConditionSignal> &signals) {
  if (!was_true) {
    if (!tree.for_duration) {
      finish(tree.root->id(), Outcome::Fired, signals);
    } else if (tree.duration_timer == kInvalidTimer) {
      start_duration_timer(tree, now);
    }
    return;
  }

  // Went false: a running duration restarts from zero next time
  if (tree.duration_timer != kInvalidTimer) {
    timers_.cancel(tree.duration_timer);
    tree.duration_timer = kInvalidTimer;
    ++tree.duration_token;
  }
}

// -----------------------------
// Timer callbacks (timer service context)
// -----------------------------

void RuleEngine::on_timeout_elapsed(ConditionId root, uint64_t registration) {
  std::vector<ConditionSignal> signals;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trees_.find(root);
    if (it == trees_.end() || it->second.registration != registration) {
      return;
    }
    it->second.timeout_timer = kInvalidTimer;
    finish(root, Outcome::TimedOut, signals);
  }
  deliver(signals);
}

void RuleEngine::on_duration_elapsed(ConditionId root, uint64_t registration,
                                     uint64_t token) {
  std::vector<ConditionSignal> signals;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trees_.find(root);
    if (it == trees_.end() || it->second.registration != registration ||
        it->second.duration_token != token ||
        it->second.duration_timer == kInvalidTimer) {
      return;
    }
    if (!it->second.root->current_state()) {
      return;
    }
    it->second.duration_timer = kInvalidTimer;
    finish(root, Outcome::Fired, signals);
  }
  deliver(signals);
}

void RuleEngine::deliver(std::vector<ConditionSignal> &signals) {
  for (auto &signal : signals) {
    try {
      signal();
    } catch (const std::exception &e) {
      std::cerr << "[RuleEngine] Condition signal handler failed: "
                << e.what() << std::endl;
    }
  }
}

} // namespace rules_engine
