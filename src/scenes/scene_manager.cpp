#include "scenes/scene_manager.hpp"

#include <iostream>

#include "core/errors.hpp"

namespace rules_scenes {

std::vector<rules_engine::SceneRequirement> Scene::requirements() const {
  std::vector<rules_engine::SceneRequirement> out;
  out.reserve(device_states.size());
  for (const auto &state : device_states) {
    out.push_back({state.device_id, state.attribute, state.value});
  }
  return out;
}

SceneManager::SceneManager(rules_hub::HubClient &hub) : hub_(hub) {}

void SceneManager::create_scene(const Scene &scene) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (scenes_.count(scene.name) > 0) {
    throw hub_rules::DuplicateError("Scene '" + scene.name +
                                    "' already exists");
  }
  scenes_[scene.name] = scene;
  for (const auto &state : scene.device_states) {
    device_to_scenes_[state.device_id].insert(scene.name);
  }
}

Scene SceneManager::delete_scene(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = scenes_.find(name);
  if (it == scenes_.end()) {
    throw hub_rules::NotFoundError("Scene '" + name + "' not found");
  }
  Scene scene = it->second;
  scenes_.erase(it);

  for (const auto &state : scene.device_states) {
    auto dev = device_to_scenes_.find(state.device_id);
    if (dev == device_to_scenes_.end()) {
      continue;
    }
    dev->second.erase(name);
    if (dev->second.empty()) {
      device_to_scenes_.erase(dev);
    }
  }
  return scene;
}

std::vector<Scene>
SceneManager::list_scenes(const std::optional<DeviceId> &device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Scene> out;
  if (!device_id) {
    for (const auto &kv : scenes_) {
      out.push_back(kv.second);
    }
    return out;
  }

  auto dev = device_to_scenes_.find(*device_id);
  if (dev == device_to_scenes_.end()) {
    return out;
  }
  for (const auto &name : dev->second) {
    out.push_back(scenes_.at(name));
  }
  return out;
}

std::optional<Scene> SceneManager::find_scene(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = scenes_.find(name);
  if (it == scenes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool SceneManager::is_scene_set(const ExecutionContext &ctx,
                                const std::string &name) {
  const Scene scene = get_or_throw(name);
  const ExecutionContext scene_ctx = ctx.with_scene(name);

  for (const auto &state : scene.device_states) {
    const Value current = hub_.fetch(scene_ctx.with_device(state.device_id),
                                     state.device_id, state.attribute);
    if (!hub_rules::compare_values(hub_rules::coerce_like(current, state.value),
                                   hub_rules::CompareOp::Equal,
                                   state.value)) {
      return false;
    }
  }
  return true;
}

SceneApplyResult SceneManager::enable_scene(const ExecutionContext &ctx,
                                            const std::string &name) {
  const Scene scene = get_or_throw(name);
  const ExecutionContext scene_ctx = ctx.with_scene(name);

  SceneApplyResult result;
  result.scene_name = name;

  for (const auto &state : scene.device_states) {
    const auto r =
        hub_.send_command(scene_ctx.with_device(state.device_id),
                          state.device_id, state.command, state.arguments);
    if (!r.is_ok()) {
      result.failed_commands.push_back(
          {state.device_id, state.command, state.arguments, r.message});
    }
  }

  const size_t total = scene.device_states.size();
  result.success = result.failed_commands.empty();
  if (result.success) {
    result.message = "Scene '" + name + "' applied successfully (" +
                     std::to_string(total) + " commands)";
  } else {
    result.message = "Scene '" + name + "' applied with " +
                     std::to_string(result.failed_commands.size()) +
                     " failures out of " + std::to_string(total) +
                     " commands";
    std::cerr << "[SceneManager] " << result.message << std::endl;
  }
  return result;
}

Scene SceneManager::get_or_throw(const std::string &name) const {
  auto scene = find_scene(name);
  if (!scene) {
    throw hub_rules::NotFoundError("Scene '" + name + "' not found");
  }
  return *scene;
}

} // namespace rules_scenes
