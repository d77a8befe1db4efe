#ifndef CLI_H
#define CLI_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

class CLI {
    private:
        void printUsage();

        // off-chain commitment
        void buildCommitment(const std::string& inputPath, uint32_t decimals,
                             const std::string& outputPath);
        void getProof(const std::string& inputPath, const std::string& address,
                      uint32_t decimals);
        void verifyProof(const std::string& root, const std::string& address,
                         const std::string& amount, const std::string& proof);

        // persisted refund ledger
        void deploy(const std::string& owner, const std::string& root, uint64_t period,
                    bool rollbackOnFailure, uint64_t now);
        void fund(const std::string& from, const std::string& amount, uint32_t decimals);
        void claim(const std::string& caller, const std::string& amount, uint32_t decimals,
                   const std::string& proof, uint64_t now);
        void withdraw(const std::string& caller, const std::string& amount, uint32_t decimals,
                      uint64_t now);
        void status(const std::string& address, uint64_t now);

    public:
        CLI() = default;
        void run(int argc, char* argv[]);
};

#endif
