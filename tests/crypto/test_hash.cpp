// VELEDGER - Hash Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "veledger/crypto/hash.h"

using namespace veledger;
using namespace veledger::crypto;

TEST(HashTest, Sha256KnownVectors) {
    EXPECT_EQ(HexStr(Sha256(nullptr, 0).data(), 32),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    std::string abc = "abc";
    EXPECT_EQ(HexStr(Sha256(reinterpret_cast<const Byte*>(abc.data()), abc.size()).data(), 32),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashTest, WriterMatchesOneShot) {
    HashWriter writer;
    writer.Write(std::string("ab")).Write(std::string("c"));
    std::string abc = "abc";
    EXPECT_EQ(writer.GetHash(), Sha256(reinterpret_cast<const Byte*>(abc.data()), abc.size()));
}

TEST(HashTest, WriteU64IsBigEndian) {
    HashWriter a;
    a.WriteU64(0x0102030405060708ULL);
    std::vector<Byte> expected = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(a.GetHash(), Sha256(expected));
}

TEST(HashTest, AddressesAreHashedRaw) {
    Address addr = Address::FromLabel(3);
    HashWriter writer;
    writer.Write(addr);
    EXPECT_EQ(writer.GetHash(), Sha256(addr.data(), Address::SIZE));
}
