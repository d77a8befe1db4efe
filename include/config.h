#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>

inline const std::string DEFAULT_DATA_DIR = "./data";

// refund parameters
namespace Refund {

    inline constexpr size_t HASH_SIZE = 32;
    inline constexpr size_t ADDRESS_SIZE = 20;
    inline constexpr size_t AMOUNT_SIZE = 32;  // uint256, big-endian

    // 90 days
    inline constexpr uint64_t REFUND_PERIOD = 90ULL * 24 * 60 * 60;  // 7 776 000 s

    inline constexpr uint32_t DEFAULT_DECIMALS = 18;
    inline constexpr uint32_t MAX_DECIMALS = 77;  // 10^78 no longer fits in 256 bits

    // KECCAK-256 needs OpenSSL 3.2+, SHA3-256 is there since 3.0
    inline const std::string DEFAULT_DIGEST = "SHA3-256";

}  // namespace Refund

// runtime settings
namespace Config {

    void SetDataDir(const std::string& dir);
    const std::string& GetDataDir();

    std::string GetLedgerPath();

    void SetDigestName(const std::string& name);
    const std::string& GetDigestName();

}  // namespace Config

#endif
