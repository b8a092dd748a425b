#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tinybook::core {

// Process-wide knobs. Read once from the environment:
// - `TINYBOOK_TRACE=1`: per-operation trace lines on stderr
// - `TINYBOOK_ACCOUNTING=1`: byte accounting (see runtime/accounting.hpp)
// - `TINYBOOK_BATCH_SIZE`: default preprocessing batch size (default 64)
// - `TINYBOOK_DEALER_SEED`: deterministic dealer keys; OpenSSL RAND_bytes otherwise
struct Config {
  bool trace = false;
  bool accounting = false;
  size_t default_batch_size = 64;
  std::optional<uint64_t> dealer_seed;

  static Config from_env();
};

// Snapshot of the process configuration; safe against concurrent set_config.
Config config();
void set_config(const Config& cfg);

bool env_flag_enabled_default(const char* name, bool defv);
size_t env_size_or(const char* name, size_t defv);

inline bool trace_enabled() { return config().trace; }

}  // namespace tinybook::core
