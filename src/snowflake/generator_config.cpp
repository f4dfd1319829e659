#include "flakeid/snowflake/generator_config.h"

#include "flakeid/core/time.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace flakeid::snowflake {

namespace {

using json = nlohmann::json;
using ConfigResult = core::Result<GeneratorConfig, std::string>;

// Each reader returns "" on success (or when the key is absent) and an error otherwise.

std::string read_int64(const json& j, const char* key, std::optional<std::int64_t>& out) {
  if (!j.contains(key)) {
    return "";
  }
  const json& v = j.at(key);
  if (v.is_null()) {
    out = std::nullopt;
    return "";
  }
  if (!v.is_number_integer()) {
    return std::string("config key '") + key + "' must be an integer";
  }
  out = v.get<std::int64_t>();
  return "";
}

std::string read_int(const json& j, const char* key, int& out) {
  std::optional<std::int64_t> value;
  if (auto error = read_int64(j, key, value); !error.empty()) {
    return error;
  }
  if (!value.has_value()) {
    return "";
  }
  if (*value < -1000 || *value > 1000) {
    return std::string("config key '") + key + "' is out of range";
  }
  out = static_cast<int>(*value);
  return "";
}

std::string read_epoch(const json& j, std::int64_t& out) {
  if (!j.contains("epoch")) {
    return "";
  }
  const json& v = j.at("epoch");
  if (v.is_number_integer()) {
    out = v.get<std::int64_t>();
    return "";
  }
  if (v.is_string()) {
    const auto parsed = core::parse_iso8601_utc_millis(v.get<std::string>());
    if (!parsed.has_value()) {
      return "config key 'epoch' is not a valid ISO-8601 UTC instant: " + v.get<std::string>();
    }
    out = *parsed;
    return "";
  }
  return "config key 'epoch' must be an ISO-8601 string or integer milliseconds";
}

}  // namespace

std::optional<WorkerIdSource> parse_worker_id_source(const std::string_view name) {
  if (name == "static") {
    return WorkerIdSource::kStatic;
  }
  if (name == "hostname") {
    return WorkerIdSource::kHostname;
  }
  if (name == "pid") {
    return WorkerIdSource::kProcessId;
  }
  if (name == "datacenter") {
    return WorkerIdSource::kDatacenter;
  }
  return std::nullopt;
}

std::string_view to_string(const WorkerIdSource source) {
  switch (source) {
    case WorkerIdSource::kStatic:
      return "static";
    case WorkerIdSource::kHostname:
      return "hostname";
    case WorkerIdSource::kProcessId:
      return "pid";
    case WorkerIdSource::kDatacenter:
      return "datacenter";
  }
  return "unknown";
}

ConfigResult generator_config_from_json(const std::string& json_str, GeneratorConfig base) {
  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    return ConfigResult::err(std::string("invalid JSON: ") + e.what());
  }
  if (!j.is_object()) {
    return ConfigResult::err("config document must be a JSON object");
  }

  GeneratorConfig config = std::move(base);
  GeneratorOptions& options = config.options;

  std::optional<std::int64_t> timestamp_bits =
      options.timestamp_bits.has_value() ? std::optional<std::int64_t>(*options.timestamp_bits)
                                         : std::nullopt;
  std::optional<std::int64_t> tolerance = options.clock_rollback_tolerance_ms;
  std::optional<std::int64_t> max_wait_ms;
  if (options.max_wait.has_value()) {
    max_wait_ms = options.max_wait->count();
  }

  for (auto error : {read_epoch(j, options.epoch_unix_ms),
                     read_int64(j, "timestamp_bits", timestamp_bits),
                     read_int(j, "worker_bits", options.worker_bits),
                     read_int(j, "sequence_bits", options.sequence_bits),
                     read_int64(j, "clock_rollback_tolerance_ms", tolerance),
                     read_int64(j, "max_wait_ms", max_wait_ms),
                     read_int64(j, "worker_id", config.worker_id),
                     read_int64(j, "datacenter_id", config.datacenter_id),
                     read_int(j, "datacenter_bits", config.datacenter_bits)}) {
    if (!error.empty()) {
      return ConfigResult::err(error);
    }
  }

  if (timestamp_bits.has_value()) {
    if (*timestamp_bits < -1000 || *timestamp_bits > 1000) {
      return ConfigResult::err("config key 'timestamp_bits' is out of range");
    }
    options.timestamp_bits = static_cast<int>(*timestamp_bits);
  } else {
    options.timestamp_bits = std::nullopt;
  }
  options.clock_rollback_tolerance_ms = tolerance.value_or(0);
  if (max_wait_ms.has_value()) {
    options.max_wait = std::chrono::milliseconds{*max_wait_ms};
  } else {
    options.max_wait = std::nullopt;
  }

  if (j.contains("worker_source")) {
    const json& v = j.at("worker_source");
    if (!v.is_string()) {
      return ConfigResult::err("config key 'worker_source' must be a string");
    }
    const auto source = parse_worker_id_source(v.get<std::string>());
    if (!source.has_value()) {
      return ConfigResult::err("config key 'worker_source' must be one of static, hostname, pid, "
                               "datacenter (got '" +
                               v.get<std::string>() + "')");
    }
    config.worker_source = *source;
  }

  if (j.contains("hostname")) {
    const json& v = j.at("hostname");
    if (v.is_null()) {
      config.hostname = std::nullopt;
    } else if (v.is_string()) {
      config.hostname = v.get<std::string>();
    } else {
      return ConfigResult::err("config key 'hostname' must be a string");
    }
  }

  return ConfigResult::ok(std::move(config));
}

ConfigResult load_generator_config(const std::string& path, GeneratorConfig base) {
  std::ifstream in(path);
  if (!in) {
    return ConfigResult::err("cannot open config file: " + path);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  auto result = generator_config_from_json(contents.str(), std::move(base));
  if (!result.has_value()) {
    return ConfigResult::err(path + ": " + result.error());
  }
  return result;
}

std::string to_json(const GeneratorConfig& config) {
  const GeneratorOptions& options = config.options;

  // nlohmann::json default container is std::map, so keys sort alphabetically.
  json j;
  j["clock_rollback_tolerance_ms"] = options.clock_rollback_tolerance_ms;
  j["datacenter_bits"] = config.datacenter_bits;
  j["datacenter_id"] = config.datacenter_id.has_value() ? json(*config.datacenter_id) : json();
  // Epochs without a four-digit-year rendering round-trip as integer milliseconds.
  const auto epoch_iso = core::format_iso8601_utc_millis(options.epoch_unix_ms);
  j["epoch"] = epoch_iso.has_value() ? json(*epoch_iso) : json(options.epoch_unix_ms);
  j["hostname"] = config.hostname.has_value() ? json(*config.hostname) : json();
  j["max_wait_ms"] = options.max_wait.has_value() ? json(options.max_wait->count()) : json();
  j["sequence_bits"] = options.sequence_bits;
  j["timestamp_bits"] =
      options.timestamp_bits.has_value() ? json(*options.timestamp_bits) : json();
  j["worker_bits"] = options.worker_bits;
  j["worker_id"] = config.worker_id.has_value() ? json(*config.worker_id) : json();
  j["worker_source"] = std::string(to_string(config.worker_source));

  return j.dump();
}

core::Result<std::unique_ptr<IWorkerIdAllocator>, std::string> make_worker_id_allocator(
    const GeneratorConfig& config) {
  using R = core::Result<std::unique_ptr<IWorkerIdAllocator>, std::string>;

  switch (config.worker_source) {
    case WorkerIdSource::kStatic:
      if (!config.worker_id.has_value()) {
        return R::err("worker source 'static' requires a worker id");
      }
      return R::ok(std::make_unique<StaticWorkerIdAllocator>(*config.worker_id));
    case WorkerIdSource::kHostname:
      if (config.hostname.has_value()) {
        return R::ok(std::make_unique<HostnameWorkerIdAllocator>(*config.hostname));
      }
      return R::ok(std::make_unique<HostnameWorkerIdAllocator>());
    case WorkerIdSource::kProcessId:
      return R::ok(std::make_unique<ProcessIdWorkerIdAllocator>());
    case WorkerIdSource::kDatacenter:
      if (!config.datacenter_id.has_value() || !config.worker_id.has_value()) {
        return R::err("worker source 'datacenter' requires a datacenter id and a worker id");
      }
      return R::ok(std::make_unique<DatacenterWorkerIdAllocator>(
          *config.datacenter_id, *config.worker_id, config.datacenter_bits));
  }
  return R::err("unknown worker source");
}

}  // namespace flakeid::snowflake
