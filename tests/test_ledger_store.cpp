#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "commitment.h"
#include "config.h"
#include "ledgerStore.h"
#include "refundContract.h"
#include "refundError.h"

class LedgerStoreTest : public ::testing::Test {
    protected:
        std::filesystem::path dir;

        const Address owner = ParseAddress("0x0dD01F57994c11e3f9fFc16E555F95e9a7d62046");
        const Address alice = ParseAddress("0xF525E7409441743Dc77B5BaacF4755f4cc33400b");
        const Address bob = ParseAddress("0x54859974A781e80a8D7353F4291B39b4988F8036");

        void SetUp() override {
            const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir = std::filesystem::temp_directory_path() /
                  ("merkle_refund_store_" + std::string(info->name()));
            std::filesystem::remove_all(dir);
        }

        void TearDown() override {
            std::filesystem::remove_all(dir);
            Config::SetDigestName(Refund::DEFAULT_DIGEST);
        }

        std::string ledgerPath() const { return (dir / "ledger").string(); }

        Commitment buildCommitment() const {
            return Commitment::Build(std::map<std::string, std::string>{
                {AddressToString(alice), "1"}, {AddressToString(bob), "2.5"}});
        }
};

TEST_F(LedgerStoreTest, CreateThenReopen) {
    Commitment commitment = buildCommitment();
    StoreEnvironment env(1'700'000'000);

    RefundContract contract = RefundContract::Create(env, owner, commitment.GetRoot());
    EXPECT_FALSE(LedgerStore::Exists(ledgerPath()));
    LedgerStore::Create(ledgerPath(), contract.GetState());
    EXPECT_TRUE(LedgerStore::Exists(ledgerPath()));

    auto store = LedgerStore::Open(ledgerPath());
    RefundState loaded = store->Load();

    EXPECT_EQ(loaded.merkleRoot, commitment.GetRoot());
    EXPECT_EQ(loaded.owner, owner);
    EXPECT_EQ(loaded.refundDeadline, 1'700'000'000 + Refund::REFUND_PERIOD);
    EXPECT_TRUE(loaded.balance.IsZero());
    EXPECT_FALSE(loaded.rollbackClaimOnTransferFailure);
    EXPECT_EQ(loaded.digest, Refund::DEFAULT_DIGEST);
    EXPECT_TRUE(loaded.claimed.empty());
    EXPECT_TRUE(loaded.events.empty());
}

TEST_F(LedgerStoreTest, ClaimsEventsAndPayoutsSurviveReopen) {
    Commitment commitment = buildCommitment();
    StoreEnvironment deployEnv(1'700'000'000);

    RefundParams params;
    params.rollbackClaimOnTransferFailure = true;
    RefundContract created = RefundContract::Create(deployEnv, owner, commitment.GetRoot(), params);
    LedgerStore::Create(ledgerPath(), created.GetState());

    {
        auto store = LedgerStore::Open(ledgerPath());
        RefundContract contract(store->Load());
        contract.Receive(owner, commitment.GetTotal());
        store->Save(contract.GetState());
    }

    {
        auto store = LedgerStore::Open(ledgerPath());
        RefundContract contract(store->Load());
        StoreEnvironment env(1'700'000'100);

        Amount amount = commitment.GetEntry(alice).amount;
        contract.ClaimRefund(env, alice, commitment.GetProof(alice, amount), amount);
        store->Save(contract.GetState(), env.GetPendingPayouts());
    }

    auto store = LedgerStore::Open(ledgerPath());
    RefundState loaded = store->Load();

    EXPECT_TRUE(loaded.rollbackClaimOnTransferFailure);
    EXPECT_EQ(loaded.balance.ToString(), "2500000000000000000");
    EXPECT_EQ(loaded.claimed.count(alice), 1u);
    EXPECT_EQ(loaded.claimed.count(bob), 0u);

    ASSERT_EQ(loaded.events.size(), 1u);
    RefundEvent expected{RefundEventType::Refunded, alice, Amount::ParseUnits("1", 18)};
    EXPECT_EQ(loaded.events[0], expected);

    EXPECT_EQ(store->GetPayouts(alice).ToString(), "1000000000000000000");
    EXPECT_TRUE(store->GetPayouts(bob).IsZero());

    // a reloaded ledger still refuses the second claim
    RefundContract contract(std::move(loaded));
    StoreEnvironment env(1'700'000'200);
    Amount amount = commitment.GetEntry(alice).amount;
    try {
        contract.ClaimRefund(env, alice, commitment.GetProof(alice, amount), amount);
        FAIL() << "second claim accepted after reload";
    } catch (const RefundError& e) {
        EXPECT_EQ(e.GetCode(), RefundErrorCode::AlreadyClaimed);
    }
}

TEST_F(LedgerStoreTest, PayoutsAccumulate) {
    Commitment commitment = buildCommitment();
    StoreEnvironment env(1'700'000'000);
    RefundContract contract = RefundContract::Create(env, owner, commitment.GetRoot());
    auto store = LedgerStore::Create(ledgerPath(), contract.GetState());

    EXPECT_TRUE(env.Transfer(bob, Amount(5)));
    EXPECT_TRUE(env.Transfer(bob, Amount(7)));
    store->Save(contract.GetState(), env.GetPendingPayouts());
    store->Save(contract.GetState(), env.GetPendingPayouts());

    EXPECT_EQ(store->GetPayouts(bob), Amount(24));
}

TEST_F(LedgerStoreTest, CreateRefusesExistingLedgerAndOpenRefusesMissingOne) {
    EXPECT_THROW(LedgerStore::Open(ledgerPath()), std::runtime_error);

    Commitment commitment = buildCommitment();
    StoreEnvironment env(1'700'000'000);
    RefundContract contract = RefundContract::Create(env, owner, commitment.GetRoot());

    LedgerStore::Create(ledgerPath(), contract.GetState());
    EXPECT_THROW(LedgerStore::Create(ledgerPath(), contract.GetState()), std::runtime_error);
}

TEST_F(LedgerStoreTest, DigestSurvivesReopenUnderAnotherSetting) {
    Config::SetDigestName("SHA256");
    Commitment commitment = buildCommitment();
    StoreEnvironment deployEnv(1'700'000'000);

    RefundContract created = RefundContract::Create(deployEnv, owner, commitment.GetRoot());
    created.Receive(owner, commitment.GetTotal());
    LedgerStore::Create(ledgerPath(), created.GetState());

    Amount amount = commitment.GetEntry(bob).amount;
    std::vector<Hash> proof = commitment.GetProof(bob, amount);

    Config::SetDigestName(Refund::DEFAULT_DIGEST);

    auto store = LedgerStore::Open(ledgerPath());
    RefundContract contract(store->Load());
    EXPECT_EQ(contract.GetDigest(), "SHA256");

    StoreEnvironment env(1'700'000'100);
    contract.ClaimRefund(env, bob, proof, amount);
    store->Save(contract.GetState(), env.GetPendingPayouts());

    EXPECT_EQ(store->GetPayouts(bob).ToString(), "2500000000000000000");
    EXPECT_EQ(store->Load().digest, "SHA256");
}
