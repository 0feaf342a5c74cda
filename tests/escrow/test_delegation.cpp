// VELEDGER - Delegation Index Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/escrow/delegation.h"

using namespace veledger;
using namespace veledger::escrow;

class DelegationIndexTest : public ::testing::Test {
protected:
    void Move(const Address& from, const Address& to, std::vector<TokenId> ids, Timestamp now) {
        Transaction tx(journal_);
        index_.MoveIds(from, to, ids, now);
        tx.Commit();
    }

    Journal journal_;
    DelegationIndex index_{journal_};
    Address alice_ = Address::FromLabel(1);
    Address bob_ = Address::FromLabel(2);
};

TEST_F(DelegationIndexTest, SelfDelegationByDefault) {
    EXPECT_EQ(index_.DelegateOf(alice_), alice_);
    EXPECT_FALSE(index_.HasExplicitDelegate(alice_));

    {
        Transaction tx(journal_);
        index_.SetDelegate(alice_, bob_);
        tx.Commit();
    }
    EXPECT_EQ(index_.DelegateOf(alice_), bob_);

    {
        Transaction tx(journal_);
        index_.SetDelegate(alice_, Address());
        tx.Commit();
    }
    EXPECT_EQ(index_.DelegateOf(alice_), alice_);
}

TEST_F(DelegationIndexTest, MoveIdsCheckpointsBothSides) {
    Move(Address(), alice_, {1, 2}, 100);
    Move(alice_, bob_, {1}, 200);

    EXPECT_EQ(index_.CurrentSet(alice_), std::vector<TokenId>({2}));
    EXPECT_EQ(index_.CurrentSet(bob_), std::vector<TokenId>({1}));
    EXPECT_EQ(index_.NumCheckpoints(alice_), 2u);
    EXPECT_EQ(index_.NumCheckpoints(bob_), 1u);
    EXPECT_EQ(index_.CheckpointAt(alice_, 0).ts, 100);
    EXPECT_THROW(index_.CheckpointAt(bob_, 1), PreconditionError);
}

TEST_F(DelegationIndexTest, SetAtIsHistorical) {
    Move(Address(), alice_, {1, 2}, 100);
    Move(alice_, bob_, {2}, 200);

    EXPECT_TRUE(index_.SetAt(alice_, 99).empty());
    EXPECT_EQ(index_.SetAt(alice_, 150), std::vector<TokenId>({1, 2}));
    EXPECT_EQ(index_.SetAt(alice_, 200), std::vector<TokenId>({1}));
    EXPECT_TRUE(index_.SetAt(bob_, 199).empty());
    EXPECT_EQ(index_.SetAt(bob_, 1000), std::vector<TokenId>({2}));
}

TEST_F(DelegationIndexTest, SameInstantPushIsFlashProtected) {
    Move(Address(), alice_, {1}, 100);
    try {
        Move(Address(), alice_, {2}, 100);
        FAIL() << "expected PreconditionError";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FlashProtected);
    }
    EXPECT_EQ(index_.CurrentSet(alice_), std::vector<TokenId>({1}));
}

TEST_F(DelegationIndexTest, MissingOrDuplicateIdsRejected) {
    Move(Address(), alice_, {1}, 100);
    EXPECT_THROW(Move(alice_, bob_, {7}, 200), InvariantError);
    EXPECT_THROW(Move(Address(), alice_, {1}, 300), InvariantError);
    // Rolled back: no partial checkpoints
    EXPECT_EQ(index_.NumCheckpoints(alice_), 1u);
    EXPECT_EQ(index_.NumCheckpoints(bob_), 0u);
}

TEST_F(DelegationIndexTest, MoveToSelfIsNoOp) {
    Move(Address(), alice_, {1}, 100);
    Move(alice_, alice_, {1}, 200);
    EXPECT_EQ(index_.NumCheckpoints(alice_), 1u);
}

TEST_F(DelegationIndexTest, NoncesIncrementInOrder) {
    EXPECT_EQ(index_.Nonce(alice_), 0u);
    {
        Transaction tx(journal_);
        index_.UseNonce(alice_, 0);
        tx.Commit();
    }
    EXPECT_EQ(index_.Nonce(alice_), 1u);

    Transaction tx(journal_);
    try {
        index_.UseNonce(alice_, 0);
        FAIL() << "expected PreconditionError";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SignatureInvalid);
    }
}

TEST_F(DelegationIndexTest, ExportImport) {
    Move(Address(), alice_, {1, 2}, 100);
    DelegationIndex::State state = index_.Export();

    Journal other;
    DelegationIndex copy(other);
    copy.Import(state);
    EXPECT_EQ(copy.SetAt(alice_, 100), std::vector<TokenId>({1, 2}));

    state.checkpoints[bob_] = {DelegationCheckpoint{50, {3}}, DelegationCheckpoint{50, {4}}};
    EXPECT_THROW(copy.Import(state), InvariantError);
}
