#include "command_handler.hpp"  // Include the header with the function declaration.

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include "device_error.hpp"
#include "log.hpp"

namespace {

// Sizes may come as a number of MiB or as a qemu size string.
std::uint64_t memory_from_json(const json& value) {
  if (value.is_number_unsigned() || value.is_number_integer()) {
    return parse_memory_size(std::to_string(value.get<long long>()));
  }
  return parse_memory_size(value.get<std::string>());
}

// Integer parameter within [low, high]; anything else is a usage error.
int int_from_json(const json& value, const std::string& name, int low, int high) {
  bool inRange = false;
  if (value.is_number_unsigned()) {
    inRange = value.get<std::uint64_t>() >= static_cast<std::uint64_t>(std::max(low, 0)) &&
              value.get<std::uint64_t>() <= static_cast<std::uint64_t>(high);
  } else if (value.is_number_integer()) {
    inRange = value.get<long long>() >= low && value.get<long long>() <= high;
  } else {
    throw UsageError("Parameter '" + name + "' must be an integer");
  }
  if (!inRange) {
    throw UsageError("Parameter '" + name + "' out of range: " + value.dump());
  }
  return value.get<int>();
}

json error_response(const std::string& error, const std::string& message) {
  json response;
  response["status"] = "error";
  response["error"] = error;
  response["message"] = message;
  return response;
}

}  // namespace

InstanceConfig config_from_json(const json& params, const InstanceConfig& defaults) {
  InstanceConfig config = defaults;
  if (params.contains("image")) {
    config.imagePath = params["image"].get<std::string>();
  }
  if (params.contains("bridge")) {
    config.bridgeEnabled = params["bridge"].get<bool>();
  }
  if (params.contains("ram")) {
    config.memoryMb = memory_from_json(params["ram"]);
  }
  if (params.contains("max_ram")) {
    config.maxMemoryMb = memory_from_json(params["max_ram"]);
  }
  if (params.contains("cpu")) {
    config.cpuCount = int_from_json(params["cpu"], "cpu", 1, std::numeric_limits<int>::max());
  }
  if (params.contains("port_forward")) {
    config.portForwards.clear();
    for (const json& forward : params["port_forward"]) {
      config.portForwards.push_back(parse_port_forward(forward.get<std::string>()));
    }
  }
  if (params.contains("port_range_start")) {
    config.portRangeStart =
        int_from_json(params["port_range_start"], "port_range_start", 1, 65535);
  }
  if (params.contains("port_range_end")) {
    config.portRangeEnd = int_from_json(params["port_range_end"], "port_range_end", 1, 65535);
  }
  config.validate();
  return config;
}

json handle_to_json(const InstanceHandle& handle) {
  json result;
  result["port"] = handle.port;
  result["state"] = to_string(handle.state);
  result["guest_ip"] = handle.guestIp ? json(*handle.guestIp) : json(nullptr);
  if (handle.bridge) {
    result["bridge_ip"] = handle.bridge->hostIp;
    result["mac"] = handle.bridge->macAddress;
  }
  return result;
}

// command_json has "command" and "params"
json handle_command(const json& command_json, LifecycleController& controller,
                    const InstanceConfig& defaults) {
  std::string command;
  json response;

  try {
    command = command_json.value("command", "");
    json params = command_json.value("params", json::object());

    if (command == "start") {
      InstanceConfig config = config_from_json(params, defaults);
      if (config.imagePath.empty()) {
        throw UsageError("Parameter 'image' is mandatory");
      }
      InstanceHandle handle = controller.start(config);
      response = handle_to_json(handle);
      response["status"] = "success";
      response["message"] = "Use port " + std::to_string(handle.port) + " to ssh the device";
    }
    else if (command == "stop") {
      if (!params.contains("port")) {
        throw UsageError("Parameter 'port' is mandatory");
      }
      int port = int_from_json(params["port"], "port", 1, 65535);
      controller.stop(port);
      response = handle_to_json(controller.handle());
      response["status"] = "success";
      response["message"] = "Device on port " + std::to_string(port) + " is shutting down";
    }
    else if (command == "status") {
      response = handle_to_json(controller.handle());
      response["status"] = "success";
      if (!controller.failed_stage().empty()) {
        response["failed_stage"] = controller.failed_stage();
      }
    }
    else {
      response = error_response("UsageError", "Unrecognized command: " + command);
    }
  }
  catch (const DeviceError& ex) {
    log_error(ex.what());
    response = error_response(to_string(ex.kind()), ex.what());
    response["stage"] = controller.failed_stage();
  }
  catch (const std::invalid_argument& ex) {
    response = error_response("UsageError", ex.what());
  }
  catch (const json::exception& ex) {
    response = error_response("UsageError", ex.what());
  }
  catch (const std::exception& ex) {
    log_error(ex.what());
    response = error_response("InternalError", ex.what());
  }

  return response;
}
