#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "conditions/scene_conditions.hpp"
#include "hub/hub_client.hpp"

namespace rules_scenes {

using hub_rules::DeviceId;
using hub_rules::ExecutionContext;
using hub_rules::Value;
using hub_rules::ValueList;

// Desired attribute value and the command that produces it
struct SceneDeviceState {
  DeviceId device_id;
  std::string attribute;
  Value value;
  std::string command;
  ValueList arguments;
};

struct Scene {
  std::string name;
  std::string description;
  std::vector<SceneDeviceState> device_states;

  std::vector<rules_engine::SceneRequirement> requirements() const;
};

struct FailedCommand {
  DeviceId device_id;
  std::string command;
  ValueList arguments;
  std::string error;
};

struct SceneApplyResult {
  bool success = false;
  std::string scene_name;
  std::string message;
  std::vector<FailedCommand> failed_commands;
};

// Scene collaborator as seen by rule execution
class SceneService {
public:
  virtual ~SceneService() = default;

  virtual std::optional<Scene> find_scene(const std::string &name) const = 0;

  // Throws hub_rules::NotFoundError for unknown scenes
  virtual bool is_scene_set(const ExecutionContext &ctx,
                            const std::string &name) = 0;
  virtual SceneApplyResult enable_scene(const ExecutionContext &ctx,
                                        const std::string &name) = 0;
};

/**
 * In-memory scene store. Applying a scene sends every requirement's command
 * once and reports the failures; retrying is left to the caller.
 */
class SceneManager : public SceneService {
public:
  explicit SceneManager(rules_hub::HubClient &hub);

  // Throws hub_rules::DuplicateError if the name is taken
  void create_scene(const Scene &scene);

  // Throws hub_rules::NotFoundError if unknown; returns the removed scene
  Scene delete_scene(const std::string &name);

  // All scenes, or only those touching device_id when given
  std::vector<Scene> list_scenes(
      const std::optional<DeviceId> &device_id = std::nullopt) const;

  std::optional<Scene> find_scene(const std::string &name) const override;
  bool is_scene_set(const ExecutionContext &ctx,
                    const std::string &name) override;
  SceneApplyResult enable_scene(const ExecutionContext &ctx,
                                const std::string &name) override;

private:
  Scene get_or_throw(const std::string &name) const;

  rules_hub::HubClient &hub_;
  std::map<std::string, Scene> scenes_;
  std::map<DeviceId, std::set<std::string>> device_to_scenes_;
  mutable std::mutex mutex_;
};

} // namespace rules_scenes
