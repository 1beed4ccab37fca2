// command_handler.hpp
#ifndef COMMAND_HANDLER_HPP
#define COMMAND_HANDLER_HPP

#include <nlohmann/json.hpp>

#include "instance_config.hpp"
#include "lifecycle_controller.hpp"

using json = nlohmann::json;

// Processes the JSON command and returns a JSON response.
// Start requests fill their config on top of `defaults`.
json handle_command(const json& command_json, LifecycleController& controller,
                    const InstanceConfig& defaults);

// Overrides `defaults` with the request params ("image", "bridge", "ram",
// "max_ram", "cpu", "port_forward", "port_range_start", "port_range_end").
InstanceConfig config_from_json(const json& params, const InstanceConfig& defaults);

json handle_to_json(const InstanceHandle& handle);

#endif // COMMAND_HANDLER_HPP
