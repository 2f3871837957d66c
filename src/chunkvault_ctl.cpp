#include "engine/vault_engine.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace chunkvault;

static std::string stateToString(BackendState s) {
  switch (s) {
  case BackendState::ALIVE:
    return "ALIVE";
  case BackendState::SUSPECT:
    return "SUSPECT";
  default:
    return "DEAD";
  }
}

static void usage() {
  std::cout << "Usage: chunkvault [--config <file>] <command>\n"
            << "  put <file> <objectId> [version]\n"
            << "  get <objectId> <version|latest> <outFile>\n"
            << "  gc [--dry-run]\n"
            << "  tier run-once\n"
            << "  repair <digest>\n"
            << "  health\n"
            << "  metrics\n";
}

static uint64_t parseVersion(const std::string &text) {
  try {
    return std::stoull(text);
  } catch (const std::exception &) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "Not a version number: " + text);
  }
}

static int put_command(VaultEngine &engine, const std::vector<std::string> &args) {
  if (args.size() < 3) {
    usage();
    return 1;
  }
  uint64_t version = args.size() >= 4 ? parseVersion(args[3]) : 0;
  PutResult result = engine.putFile(args[1], args[2], version);
  std::cout << "Object " << result.ticket.objectId << " v"
            << result.ticket.version << ": "
            << finalizeStatusName(result.finalize.status) << " ("
            << result.ticket.totalChunks << " chunks, "
            << result.chunksStored << " newly stored)" << std::endl;
  if (result.finalize.status != FinalizeStatus::Complete) {
    std::cout << result.finalize.message << std::endl;
    return 1;
  }
  std::cout << "sha256 " << result.finalize.computedDigest << std::endl;
  return 0;
}

static int get_command(VaultEngine &engine, const std::vector<std::string> &args) {
  if (args.size() < 4) {
    usage();
    return 1;
  }
  uint64_t version = 0;
  if (args[2] == "latest") {
    auto latest = engine.index().latestCommittedVersion(args[1]);
    if (!latest) {
      std::cout << "No committed version of " << args[1] << std::endl;
      return 1;
    }
    version = *latest;
  } else {
    version = parseVersion(args[2]);
  }
  std::ofstream out(args[3], std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cout << "Cannot open " << args[3] << std::endl;
    return 1;
  }
  uint64_t bytes = engine.reader().readTo(args[1], version, out);
  std::cout << "Wrote " << bytes << " bytes to " << args[3] << std::endl;
  return 0;
}

static int gc_command(VaultEngine &engine, const std::vector<std::string> &args) {
  bool dryRun = args.size() >= 2 && args[1] == "--dry-run";
  GCStats stats = engine.garbageCollector().collect(dryRun);
  std::cout << "Total chunks: " << stats.totalChunks
            << "\nReclaimable: " << stats.reclaimableChunks << " ("
            << stats.reclaimableBytes << " bytes)"
            << "\nFreed: " << stats.freedChunks << " (" << stats.freedBytes
            << " bytes, " << stats.shardFilesRemoved << " shard files)"
            << std::endl;
  return 0;
}

static int tier_command(VaultEngine &engine, const std::vector<std::string> &args) {
  if (args.size() < 2 || args[1] != "run-once") {
    usage();
    return 1;
  }
  TieringStats stats = engine.tiering().runOnce();
  std::cout << "Scanned " << stats.scanned << ", reclassified "
            << stats.changed << " (hot " << stats.hot << ", warm "
            << stats.warm << ", cold " << stats.cold << ")" << std::endl;
  return 0;
}

static int repair_command(VaultEngine &engine, const std::vector<std::string> &args) {
  if (args.size() < 2) {
    usage();
    return 1;
  }
  size_t rewritten = engine.repairChunk(args[1]);
  std::cout << "Rewrote " << rewritten << " shards of " << args[1]
            << std::endl;
  return 0;
}

static int health_command(VaultEngine &engine) {
  auto snap = engine.health().snapshot();
  auto now = SteadyClock::now();
  std::cout << "Backend\tState\tLastChangeAgo" << std::endl;
  for (const auto &kv : snap) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(
                   now - kv.second.lastChange)
                   .count();
    std::cout << kv.first << '\t' << stateToString(kv.second.state) << '\t'
              << age << "s" << std::endl;
  }
  return 0;
}

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string configPath;
  if (args.size() >= 2 && args[0] == "--config") {
    configPath = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage();
    return 1;
  }

  EngineConfig config;
  try {
    config = loadEngineConfig(configPath);
    std::filesystem::create_directories(logsDir());
    Logger::init(logsDir() + "/chunkvault.log", config.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: initialization failed: " << e.what() << std::endl;
    return 1;
  }

  const std::string &cmd = args[0];
  try {
    VaultEngine engine(config);
    const std::string snapshot = indexSnapshotPath();
    if (std::filesystem::exists(snapshot) &&
        !engine.index().loadSnapshot(snapshot)) {
      std::cerr << "Index snapshot " << snapshot << " is unreadable"
                << std::endl;
      return 1;
    }

    int rc = 1;
    bool mutates = false;
    if (cmd == "put") {
      rc = put_command(engine, args);
      mutates = true;
    } else if (cmd == "get") {
      rc = get_command(engine, args);
      mutates = true; // last-access times
    } else if (cmd == "gc") {
      rc = gc_command(engine, args);
      mutates = true;
    } else if (cmd == "tier") {
      rc = tier_command(engine, args);
      mutates = true;
    } else if (cmd == "repair") {
      rc = repair_command(engine, args);
    } else if (cmd == "health") {
      rc = health_command(engine);
    } else if (cmd == "metrics") {
      std::cout << MetricsRegistry::instance().toPrometheus();
      rc = 0;
    } else {
      std::cout << "Unknown command" << std::endl;
      usage();
      return 1;
    }
    if (mutates && !engine.index().saveSnapshot(snapshot)) {
      std::cerr << "Failed to save index snapshot " << snapshot << std::endl;
      return 1;
    }
    return rc;
  } catch (const VaultException &e) {
    std::cerr << errorCodeName(e.code()) << ": " << e.what() << std::endl;
    return isRetryable(e.code()) ? 75 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
