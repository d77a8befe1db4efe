#include "config.h"

#include <filesystem>
#include <stdexcept>

namespace Config {

// internal storage for the runtime settings
static std::string dataDir = DEFAULT_DATA_DIR;
static std::string digestName = Refund::DEFAULT_DIGEST;

void SetDataDir(const std::string& dir) {
    if (dir.empty()) {
        throw std::invalid_argument("Data directory cannot be empty");
    }
    dataDir = dir;
}

const std::string& GetDataDir() { return dataDir; }

std::string GetLedgerPath() { return (std::filesystem::path(dataDir) / "ledger").string(); }

void SetDigestName(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Digest name cannot be empty");
    }
    digestName = name;
}

const std::string& GetDigestName() { return digestName; }

}  // namespace Config
