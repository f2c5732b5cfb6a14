#include "workgraph/config/config.hpp"

#include "workgraph/util/log.hpp"

#include <yaml-cpp/yaml.h>

namespace workgraph {

namespace {

template <typename T>
auto read_field(const YAML::Node& node, std::string_view key, T default_val)
    -> T {
  if (auto field = node[std::string(key)]) {
    return field.template as<T>();
  }
  return default_val;
}

template <typename T>
auto write_field(YAML::Emitter& out, std::string_view key, const T& value)
    -> void {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

auto from_yaml(const YAML::Node& node, StoreConfig& s) -> Result<void> {
  auto backend_name = read_field<std::string>(
      node, "backend", std::string(store_backend_to_string(s.backend)));
  auto backend = string_to_store_backend(backend_name);
  if (!backend) {
    log::error("Unknown store backend '{}' (expected json or sqlite)",
               backend_name);
    return fail(Error::InvalidArgument);
  }
  s.backend = *backend;
  s.path = read_field<std::string>(node, "path", s.path);
  s.tag = read_field<std::string>(node, "tag", s.tag);
  return ok();
}

auto from_yaml(const YAML::Node& node, LogConfig& l) -> void {
  l.level = read_field<std::string>(node, "level", l.level);
  l.color = read_field(node, "color", l.color);
}

auto from_yaml(const YAML::Node& node, BulkConfig& b) -> Result<void> {
  b.max_range_size = read_field(node, "max_range_size", b.max_range_size);
  if (b.max_range_size == 0) {
    log::error("bulk.max_range_size must be positive");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto from_yaml(const YAML::Node& node, Config& c) -> Result<void> {
  if (!node || node.IsNull()) {
    return ok();
  }
  if (!node.IsMap()) {
    log::error("Config root must be a mapping");
    return fail(Error::ParseError);
  }
  if (auto store = node["store"]) {
    if (auto r = from_yaml(store, c.store); !r)
      return r;
  }
  if (auto log_node = node["log"])
    from_yaml(log_node, c.log);
  if (auto bulk = node["bulk"]) {
    if (auto r = from_yaml(bulk, c.bulk); !r)
      return r;
  }
  return ok();
}

auto parse(const YAML::Node& node) -> Result<Config> {
  Config config;
  if (auto r = from_yaml(node, config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<Config> {
  try {
    return parse(YAML::LoadFile(std::string(path)));
  } catch (const YAML::BadFile& e) {
    log::error("Config file {} not readable: {}", path, e.what());
    return fail(Error::FileNotFound);
  } catch (const YAML::Exception& e) {
    log::error("Failed to load config file {}: {}", path, e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<Config> {
  try {
    return parse(YAML::Load(std::string(yaml_str)));
  } catch (const YAML::Exception& e) {
    log::error("Failed to parse YAML config: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const Config& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
  write_field(out, "backend",
              std::string(store_backend_to_string(config.store.backend)));
  write_field(out, "path", config.store.path);
  if (!config.store.tag.empty()) {
    write_field(out, "tag", config.store.tag);
  }
  out << YAML::EndMap;

  out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
  write_field(out, "level", config.log.level);
  write_field(out, "color", config.log.color);
  out << YAML::EndMap;

  out << YAML::Key << "bulk" << YAML::Value << YAML::BeginMap;
  write_field(out, "max_range_size", config.bulk.max_range_size);
  out << YAML::EndMap;

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace workgraph
