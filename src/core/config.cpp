#include "tinybook/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>

namespace tinybook::core {

namespace {

std::mutex g_cfg_mu;

Config& config_storage() {
  static Config cfg = Config::from_env();
  return cfg;
}

}  // namespace

bool env_flag_enabled_default(const char* name, bool defv) {
  const char* env = std::getenv(name);
  if (!env) return defv;
  std::string v(env);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return !(v == "0" || v == "false" || v == "off" || v == "no");
}

size_t env_size_or(const char* name, size_t defv) {
  const char* env = std::getenv(name);
  if (!env || !*env) return defv;
  char* end = nullptr;
  unsigned long long v = std::strtoull(env, &end, 10);
  if (end == env || *end != '\0') return defv;
  return static_cast<size_t>(v);
}

Config Config::from_env() {
  Config cfg;
  cfg.trace = env_flag_enabled_default("TINYBOOK_TRACE", false);
  cfg.accounting = env_flag_enabled_default("TINYBOOK_ACCOUNTING", false);
  size_t batch = env_size_or("TINYBOOK_BATCH_SIZE", cfg.default_batch_size);
  if (batch > 0) cfg.default_batch_size = batch;
  const char* seed = std::getenv("TINYBOOK_DEALER_SEED");
  if (seed && *seed) {
    char* end = nullptr;
    unsigned long long v = std::strtoull(seed, &end, 0);
    if (end != seed && *end == '\0') cfg.dealer_seed = static_cast<uint64_t>(v);
  }
  return cfg;
}

Config config() {
  std::lock_guard<std::mutex> lk(g_cfg_mu);
  return config_storage();
}

void set_config(const Config& cfg) {
  std::lock_guard<std::mutex> lk(g_cfg_mu);
  config_storage() = cfg;
}

}  // namespace tinybook::core
