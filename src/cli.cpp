#include "cli.h"

#include <iostream>
#include <stdexcept>

#include "address.h"
#include "amount.h"
#include "commitment.h"
#include "config.h"
#include "ledgerStore.h"
#include "merkleProof.h"
#include "refundContract.h"
#include "refundError.h"
#include "serialization.h"

// -flag value pairs, bare flags map to an empty value
static std::map<std::string, std::string> parseFlags(int argc, char** argv,
                                                     const std::vector<std::string>& switches) {
    std::map<std::string, std::string> flags;
    for (int i = 1; i < argc; i++) {
        std::string flag = argv[i];
        if (flag.size() < 2 || flag[0] != '-') {
            throw std::invalid_argument("Unexpected argument: " + flag);
        }

        bool isSwitch = false;
        for (const std::string& s : switches) {
            if (flag == s) isSwitch = true;
        }

        if (isSwitch) {
            flags[flag] = "";
        } else {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Flag " + flag + " requires a value");
            }
            flags[flag] = argv[++i];
        }
    }
    return flags;
}

static const std::string& requireFlag(const std::map<std::string, std::string>& flags,
                                      const std::string& name, const std::string& command) {
    auto it = flags.find(name);
    if (it == flags.end()) {
        throw std::invalid_argument(command + " requires " + name + " flag");
    }
    return it->second;
}

static uint64_t parseUnsigned(const std::string& text, const std::string& name) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(name + " must be an unsigned integer: " + text);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: " + text);
    }
}

static uint32_t decimalsFlag(const std::map<std::string, std::string>& flags) {
    auto it = flags.find("-decimals");
    if (it == flags.end()) {
        return Refund::DEFAULT_DECIMALS;
    }
    uint64_t decimals = parseUnsigned(it->second, "-decimals");
    if (decimals > Refund::MAX_DECIMALS) {
        throw std::invalid_argument("-decimals must be at most " +
                                    std::to_string(Refund::MAX_DECIMALS));
    }
    return static_cast<uint32_t>(decimals);
}

static uint64_t timeFlag(const std::map<std::string, std::string>& flags) {
    auto it = flags.find("-time");
    return it == flags.end() ? StoreEnvironment::WallClock() : parseUnsigned(it->second, "-time");
}

static std::string formatTime(uint64_t timestamp) { return std::to_string(timestamp) + " s"; }

void CLI::printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  buildcommitment -input FILE [-decimals N] [-output FILE] - Build the Merkle "
                 "commitment for a JSON investor table (address -> decimal amount)\n";
    std::cout << "  getproof -input FILE -address ADDR [-decimals N] - Print the proof of one "
                 "investor\n";
    std::cout << "  verifyproof -root HEX -address ADDR -amount UNITS -proof HEX,HEX,... - Check a "
                 "proof offline (UNITS in smallest units)\n";
    std::cout << "  deploy -owner ADDR -root HEX [-period SECONDS] [-rollbackonfailure] - Create "
                 "the refund ledger\n";
    std::cout << "  fund -from ADDR -amount AMOUNT [-decimals N] - Send AMOUNT to the ledger\n";
    std::cout << "  claim -caller ADDR -amount AMOUNT -proof HEX,HEX,... [-decimals N] - Claim a "
                 "refund\n";
    std::cout << "  withdraw -caller ADDR -amount AMOUNT [-decimals N] - Owner withdrawal after "
                 "the refund period\n";
    std::cout << "  status [-address ADDR] - Print the ledger state\n";
    std::cout << "\nGlobal flags:\n";
    std::cout << "  -datadir DIR - Set the data directory (default: ./data)\n";
    std::cout << "  -digest NAME - OpenSSL digest for leaves and nodes (default: "
              << Refund::DEFAULT_DIGEST << ")\n";
    std::cout << "\nLedger commands accept -time T to run at timestamp T instead of now.\n";
}

void CLI::buildCommitment(const std::string& inputPath, uint32_t decimals,
                          const std::string& outputPath) {
    Commitment commitment = Commitment::Build(Commitment::LoadInvestorTable(inputPath), decimals);

    if (outputPath.empty()) {
        std::cout << commitment.ToJson().dump(4) << std::endl;
        return;
    }

    commitment.SaveToFile(outputPath);
    std::cout << "Merkle root: " << commitment.GetHexRoot() << std::endl;
    std::cout << "Investors: " << commitment.Size() << std::endl;
    std::cout << "Tree depth: " << commitment.GetTree().GetDepth() << std::endl;
    std::cout << "Total: " << commitment.GetTotal().FormatUnits(decimals) << std::endl;
    std::cout << "Commitment written to " << outputPath << std::endl;
}

void CLI::getProof(const std::string& inputPath, const std::string& address, uint32_t decimals) {
    Commitment commitment = Commitment::Build(Commitment::LoadInvestorTable(inputPath), decimals);
    const CommitmentEntry& entry = commitment.GetEntry(ParseAddress(address));

    std::vector<std::string> proof = commitment.GetHexProof(address);

    std::cout << "Address: " << AddressToString(entry.address) << std::endl;
    std::cout << "Amount: " << entry.amount.ToString() << " ("
              << entry.amount.FormatUnits(decimals) << ")" << std::endl;
    std::cout << "Proof:" << std::endl;
    std::string joined;
    for (const std::string& step : proof) {
        std::cout << "  " << step << std::endl;
        joined += (joined.empty() ? "" : ",") + step;
    }
    std::cout << "-proof " << joined << std::endl;
}

void CLI::verifyProof(const std::string& root, const std::string& address,
                      const std::string& amount, const std::string& proof) {
    Hash leaf = EncodeLeaf(ParseAddress(address), Amount::FromString(amount));
    bool valid = VerifyMerkleProof(ParseHashes(SplitList(proof)), ParseHash(root), leaf);

    std::cout << (valid ? "Proof is valid" : "Proof is NOT valid") << std::endl;
}

void CLI::deploy(const std::string& owner, const std::string& root, uint64_t period,
                 bool rollbackOnFailure, uint64_t now) {
    StoreEnvironment env(now);

    RefundParams params;
    params.refundPeriod = period;
    params.rollbackClaimOnTransferFailure = rollbackOnFailure;

    RefundContract contract =
        RefundContract::Create(env, ParseAddress(owner), ParseHash(root), params);
    LedgerStore::Create(Config::GetLedgerPath(), contract.GetState());

    std::cout << "Refund ledger deployed" << std::endl;
    std::cout << "Owner: " << AddressToString(contract.GetOwner()) << std::endl;
    std::cout << "Merkle root: " << HashToHex(contract.GetMerkleRoot()) << std::endl;
    std::cout << "Digest: " << contract.GetDigest() << std::endl;
    std::cout << "Refund deadline: " << formatTime(contract.GetRefundDeadline()) << std::endl;
}

void CLI::fund(const std::string& from, const std::string& amount, uint32_t decimals) {
    auto store = LedgerStore::Open(Config::GetLedgerPath());
    RefundContract contract(store->Load());

    Amount value = Amount::ParseUnits(amount, decimals);
    contract.Receive(ParseAddress(from), value);
    store->Save(contract.GetState());

    std::cout << "Received " << value.FormatUnits(decimals) << ", balance is now "
              << contract.GetBalance().FormatUnits(decimals) << std::endl;
}

void CLI::claim(const std::string& caller, const std::string& amount, uint32_t decimals,
                const std::string& proof, uint64_t now) {
    auto store = LedgerStore::Open(Config::GetLedgerPath());
    RefundContract contract(store->Load());
    StoreEnvironment env(now);

    Address account = ParseAddress(caller);
    Amount value = Amount::ParseUnits(amount, decimals);

    try {
        contract.ClaimRefund(env, account, ParseHashes(SplitList(proof)), value);
    } catch (const RefundError& e) {
        // the claim record survives a failed payout unless the ledger rolls it back
        if (e.GetCode() == RefundErrorCode::TransferFailed) {
            store->Save(contract.GetState());
        }
        throw;
    }

    store->Save(contract.GetState(), env.GetPendingPayouts());
    std::cout << "Refunded " << value.FormatUnits(decimals) << " to " << AddressToString(account)
              << std::endl;
}

void CLI::withdraw(const std::string& caller, const std::string& amount, uint32_t decimals,
                   uint64_t now) {
    auto store = LedgerStore::Open(Config::GetLedgerPath());
    RefundContract contract(store->Load());
    StoreEnvironment env(now);

    Amount value = Amount::ParseUnits(amount, decimals);
    contract.Withdraw(env, ParseAddress(caller), value);

    store->Save(contract.GetState(), env.GetPendingPayouts());
    std::cout << "Withdrawn " << value.FormatUnits(decimals) << ", balance is now "
              << contract.GetBalance().FormatUnits(decimals) << std::endl;
}

void CLI::status(const std::string& address, uint64_t now) {
    auto store = LedgerStore::Open(Config::GetLedgerPath());
    RefundContract contract(store->Load());
    StoreEnvironment env(now);

    std::cout << "Owner: " << AddressToString(contract.GetOwner()) << std::endl;
    std::cout << "Merkle root: " << HashToHex(contract.GetMerkleRoot()) << std::endl;
    std::cout << "Digest: " << contract.GetDigest() << std::endl;
    std::cout << "Refund deadline: " << formatTime(contract.GetRefundDeadline())
              << (contract.IsActive(env) ? " (active)" : " (expired)") << std::endl;
    std::cout << "Balance: " << contract.GetBalance().ToString() << std::endl;

    if (!address.empty()) {
        Address account = ParseAddress(address);
        std::cout << "Claimed by " << AddressToString(account) << ": "
                  << (contract.IsClaimed(account) ? "yes" : "no") << std::endl;
        std::cout << "Paid to " << AddressToString(account) << ": "
                  << store->GetPayouts(account).ToString() << std::endl;
    }

    std::cout << "Events:" << std::endl;
    for (const RefundEvent& event : contract.GetEvents()) {
        std::cout << "  "
                  << (event.type == RefundEventType::Refunded ? "Refunded" : "Withdrawn") << "("
                  << AddressToString(event.account) << ", " << event.amount.ToString() << ")"
                  << std::endl;
    }
}

void CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return;
    }

    // parse global flags
    int cmdStart = 1;
    while (cmdStart < argc) {
        std::string flag = argv[cmdStart];
        if (flag != "-datadir" && flag != "-digest") {
            break;
        }
        if (cmdStart + 1 >= argc) {
            std::cout << "Error: " << flag << " requires a value\n";
            printUsage();
            return;
        }
        if (flag == "-datadir") {
            Config::SetDataDir(argv[cmdStart + 1]);
        } else {
            Config::SetDigestName(argv[cmdStart + 1]);
        }
        cmdStart += 2;
    }

    if (cmdStart >= argc) {
        printUsage();
        return;
    }

    // shift argv
    int cmdArgc = argc - cmdStart;
    char** cmdArgv = argv + cmdStart;

    std::string command = cmdArgv[0];
    std::map<std::string, std::string> flags = parseFlags(cmdArgc, cmdArgv, {"-rollbackonfailure"});

    if (command == "buildcommitment") {
        auto output = flags.find("-output");
        buildCommitment(requireFlag(flags, "-input", command), decimalsFlag(flags),
                        output == flags.end() ? "" : output->second);
    } else if (command == "getproof") {
        getProof(requireFlag(flags, "-input", command), requireFlag(flags, "-address", command),
                 decimalsFlag(flags));
    } else if (command == "verifyproof") {
        verifyProof(requireFlag(flags, "-root", command), requireFlag(flags, "-address", command),
                    requireFlag(flags, "-amount", command), requireFlag(flags, "-proof", command));
    } else if (command == "deploy") {
        auto period = flags.find("-period");
        deploy(requireFlag(flags, "-owner", command), requireFlag(flags, "-root", command),
               period == flags.end() ? Refund::REFUND_PERIOD
                                     : parseUnsigned(period->second, "-period"),
               flags.count("-rollbackonfailure") > 0, timeFlag(flags));
    } else if (command == "fund") {
        fund(requireFlag(flags, "-from", command), requireFlag(flags, "-amount", command),
             decimalsFlag(flags));
    } else if (command == "claim") {
        claim(requireFlag(flags, "-caller", command), requireFlag(flags, "-amount", command),
              decimalsFlag(flags), requireFlag(flags, "-proof", command), timeFlag(flags));
    } else if (command == "withdraw") {
        withdraw(requireFlag(flags, "-caller", command), requireFlag(flags, "-amount", command),
                 decimalsFlag(flags), timeFlag(flags));
    } else if (command == "status") {
        auto address = flags.find("-address");
        status(address == flags.end() ? "" : address->second, timeFlag(flags));
    } else {
        printUsage();
    }
}
