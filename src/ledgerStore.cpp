#include "ledgerStore.h"

#include <leveldb/iterator.h>
#include <leveldb/write_batch.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "serialization.h"

static const std::string ROOT_KEY = "r";
static const std::string OWNER_KEY = "o";
static const std::string DEADLINE_KEY = "d";
static const std::string FLAGS_KEY = "p";
static const std::string BALANCE_KEY = "b";
static const std::string DIGEST_KEY = "g";
static const std::string EVENT_COUNT_KEY = "n";

static constexpr char CLAIM_PREFIX = 'c';
static constexpr char PAYOUT_PREFIX = 'a';
static constexpr char EVENT_PREFIX = 'e';

static constexpr uint8_t FLAG_ROLLBACK_CLAIM = 0x01;

static constexpr size_t EVENT_RECORD_SIZE = 1 + Refund::ADDRESS_SIZE + Refund::AMOUNT_SIZE;

static std::string toValue(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

static std::vector<uint8_t> toBytes(const std::string& value) {
    return std::vector<uint8_t>(value.begin(), value.end());
}

static std::string accountKey(char prefix, const Address& account) {
    std::string key(1, prefix);
    key.append(account.begin(), account.end());
    return key;
}

static std::string eventKey(uint64_t seq) {
    std::vector<uint8_t> key;
    key.push_back(EVENT_PREFIX);
    WriteUint64BE(key, seq);
    return toValue(key);
}

static std::string u64Value(uint64_t value) {
    std::vector<uint8_t> bytes;
    WriteUint64BE(bytes, value);
    return toValue(bytes);
}

static std::string encodeEvent(const RefundEvent& event) {
    std::vector<uint8_t> record;
    record.reserve(EVENT_RECORD_SIZE);
    record.push_back(static_cast<uint8_t>(event.type));
    record.insert(record.end(), event.account.begin(), event.account.end());
    std::vector<uint8_t> amount = event.amount.ToBytes();
    record.insert(record.end(), amount.begin(), amount.end());
    return toValue(record);
}

static RefundEvent decodeEvent(const std::string& value) {
    if (value.size() != EVENT_RECORD_SIZE) {
        throw std::runtime_error("Corrupt event record: " + std::to_string(value.size()) +
                                 " bytes");
    }

    uint8_t type = static_cast<uint8_t>(value[0]);
    if (type != static_cast<uint8_t>(RefundEventType::Refunded) &&
        type != static_cast<uint8_t>(RefundEventType::Withdrawn)) {
        throw std::runtime_error("Corrupt event record: unknown type " + std::to_string(type));
    }

    RefundEvent event;
    event.type = static_cast<RefundEventType>(type);
    std::copy(value.begin() + 1, value.begin() + 1 + Refund::ADDRESS_SIZE, event.account.begin());
    event.amount = Amount::FromBytes(toBytes(value.substr(1 + Refund::ADDRESS_SIZE)));
    return event;
}

LedgerStore::LedgerStore(std::unique_ptr<leveldb::DB> db) : db(std::move(db)) {}

bool LedgerStore::Exists(const std::string& path) {
    leveldb::DB* rawDb = nullptr;
    leveldb::Options options;
    leveldb::Status status = leveldb::DB::Open(options, path, &rawDb);
    std::unique_ptr<leveldb::DB> db(rawDb);

    return status.ok();
}

std::unique_ptr<LedgerStore> LedgerStore::Create(const std::string& path,
                                                 const RefundState& state) {
    if (Exists(path)) {
        throw std::runtime_error("Refund ledger already exists at " + path);
    }

    // ensure parent directory exists
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    leveldb::DB* rawDb = nullptr;
    leveldb::Options options;
    options.create_if_missing = true;
    options.error_if_exists = true;

    leveldb::Status status = leveldb::DB::Open(options, path, &rawDb);
    if (!status.ok()) {
        throw std::runtime_error("Error creating ledger database: " + status.ToString());
    }

    std::unique_ptr<LedgerStore> store(new LedgerStore(std::unique_ptr<leveldb::DB>(rawDb)));
    store->Save(state);

    std::cout << "[store] Refund ledger created at " << path << std::endl;
    return store;
}

std::unique_ptr<LedgerStore> LedgerStore::Open(const std::string& path) {
    leveldb::DB* rawDb = nullptr;
    leveldb::Options options;

    leveldb::Status status = leveldb::DB::Open(options, path, &rawDb);
    if (!status.ok()) {
        throw std::runtime_error("No refund ledger found at " + path +
                                 ". Deploy one first. (" + status.ToString() + ")");
    }

    return std::unique_ptr<LedgerStore>(new LedgerStore(std::unique_ptr<leveldb::DB>(rawDb)));
}

std::string LedgerStore::get(const std::string& key) const {
    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &value);
    if (!status.ok()) {
        throw std::runtime_error("Error reading ledger key '" + key.substr(0, 1) +
                                 "': " + status.ToString());
    }
    return value;
}

RefundState LedgerStore::Load() const {
    RefundState state;

    std::string root = get(ROOT_KEY);
    std::string owner = get(OWNER_KEY);
    if (root.size() != state.merkleRoot.size() || owner.size() != state.owner.size()) {
        throw std::runtime_error("Corrupt ledger header");
    }
    std::copy(root.begin(), root.end(), state.merkleRoot.begin());
    std::copy(owner.begin(), owner.end(), state.owner.begin());

    state.refundDeadline = ReadUint64BE(toBytes(get(DEADLINE_KEY)), 0);
    state.balance = Amount::FromBytes(toBytes(get(BALANCE_KEY)));

    state.digest = get(DIGEST_KEY);
    if (state.digest.empty()) {
        throw std::runtime_error("Corrupt ledger header: no digest");
    }

    std::string flags = get(FLAGS_KEY);
    state.rollbackClaimOnTransferFailure =
        !flags.empty() && (static_cast<uint8_t>(flags[0]) & FLAG_ROLLBACK_CLAIM) != 0;

    // claim flags
    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(std::string(1, CLAIM_PREFIX)); it->Valid(); it->Next()) {
        leveldb::Slice key = it->key();
        if (key.empty() || key[0] != CLAIM_PREFIX) {
            break;
        }
        if (key.size() != 1 + Refund::ADDRESS_SIZE) {
            throw std::runtime_error("Corrupt claim key");
        }

        Address account;
        std::copy(key.data() + 1, key.data() + key.size(), account.begin());
        state.claimed.insert(account);
    }

    if (!it->status().ok()) {
        throw std::runtime_error("Error iterating claims: " + it->status().ToString());
    }

    uint64_t eventCount = ReadUint64BE(toBytes(get(EVENT_COUNT_KEY)), 0);
    state.events.reserve(eventCount);
    for (uint64_t seq = 0; seq < eventCount; seq++) {
        state.events.push_back(decodeEvent(get(eventKey(seq))));
    }

    return state;
}

void LedgerStore::Save(const RefundState& state, const std::map<Address, Amount>& payouts) {
    leveldb::WriteBatch batch;

    batch.Put(ROOT_KEY, std::string(state.merkleRoot.begin(), state.merkleRoot.end()));
    batch.Put(OWNER_KEY, std::string(state.owner.begin(), state.owner.end()));
    batch.Put(DEADLINE_KEY, u64Value(state.refundDeadline));
    batch.Put(FLAGS_KEY,
              std::string(1, static_cast<char>(state.rollbackClaimOnTransferFailure
                                                   ? FLAG_ROLLBACK_CLAIM
                                                   : 0)));
    batch.Put(BALANCE_KEY, toValue(state.balance.ToBytes()));
    batch.Put(DIGEST_KEY, state.digest);

    // claims never go away, so putting every one of them is enough
    for (const Address& account : state.claimed) {
        batch.Put(accountKey(CLAIM_PREFIX, account), std::string(1, '\x01'));
    }

    for (size_t seq = 0; seq < state.events.size(); seq++) {
        batch.Put(eventKey(seq), encodeEvent(state.events[seq]));
    }
    batch.Put(EVENT_COUNT_KEY, u64Value(state.events.size()));

    for (const auto& [account, amount] : payouts) {
        Amount total = GetPayouts(account) + amount;
        batch.Put(accountKey(PAYOUT_PREFIX, account), toValue(total.ToBytes()));
    }

    // atomic write to update db
    leveldb::Status status = db->Write(leveldb::WriteOptions(), &batch);
    if (!status.ok()) {
        throw std::runtime_error("Error writing ledger state: " + status.ToString());
    }
}

Amount LedgerStore::GetPayouts(const Address& account) const {
    std::string value;
    leveldb::Status status =
        db->Get(leveldb::ReadOptions(), accountKey(PAYOUT_PREFIX, account), &value);
    if (status.IsNotFound()) {
        return Amount();
    }
    if (!status.ok()) {
        throw std::runtime_error("Error reading payouts: " + status.ToString());
    }
    return Amount::FromBytes(toBytes(value));
}

StoreEnvironment::StoreEnvironment(uint64_t now) : now(now) {}

uint64_t StoreEnvironment::WallClock() {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
}

bool StoreEnvironment::Transfer(const Address& to, const Amount& amount) {
    pendingPayouts[to] += amount;
    return true;
}
