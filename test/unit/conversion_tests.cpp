// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "bridge/conversion.hpp"
#include "../bridge/bridge_test_helpers.hpp"
#include <memory>

using namespace swaprelay::bridge;
using swaprelay::test::MakeAddress;
using swaprelay::test::MakeTransfer;

TEST_CASE("IdentityConverter - passes values through", "[bridge][conversion]") {
  IdentityConverter converter;
  auto address = MakeAddress(0x11, 20);

  REQUIRE(converter.ToChain1Address(address) == address);
  REQUIRE(converter.ToChain2Address(address) == address);
  REQUIRE(converter.ToChain2HashLock(uint256(7)) == uint256(7));
}

TEST_CASE("AddressWidthConverter - resizes between widths", "[bridge][conversion]") {
  AddressWidthConverter converter(20, 32);

  SECTION("Widening left-pads with zeros") {
    auto wide = converter.ToChain2Address(MakeAddress(0x22, 20));
    REQUIRE(wide.has_value());
    CHECK(wide->size() == 32);
    CHECK(*wide == MakeAddress(0x22, 32));
  }

  SECTION("Narrowing strips zero padding") {
    auto narrow = converter.ToChain1Address(MakeAddress(0x33, 32));
    REQUIRE(narrow.has_value());
    CHECK(*narrow == MakeAddress(0x33, 20));
  }

  SECTION("Narrowing fails on significant leading bytes") {
    auto address = MakeAddress(0x44, 32);
    address.bytes[0] = 0x01;
    CHECK_FALSE(converter.ToChain1Address(address).has_value());
  }

  SECTION("Input of the wrong width fails") {
    CHECK_FALSE(converter.ToChain2Address(MakeAddress(0x55, 32)).has_value());
    CHECK_FALSE(converter.ToChain1Address(MakeAddress(0x55, 20)).has_value());
    CHECK_FALSE(converter.ToChain2Address(BridgeAddress()).has_value());
  }
}

TEST_CASE("MakeConverter - picks the converter by width", "[bridge][conversion]") {
  auto same = MakeConverter(32, 32);
  REQUIRE(dynamic_cast<const IdentityConverter*>(same.get()) != nullptr);

  auto different = MakeConverter(20, 32);
  REQUIRE(dynamic_cast<const AddressWidthConverter*>(different.get()) != nullptr);
}

TEST_CASE("DirectedConverter - builds destination lock details", "[bridge][conversion]") {
  auto converter = std::make_shared<AddressWidthConverter>(20, 32);

  SECTION("Towards chain 2") {
    DirectedConverter directed(converter, ChainSide::Chain2);
    auto transfer = MakeTransfer(1, 250, 20);
    auto lock = directed.ToLockDetails(transfer);

    REQUIRE(lock.has_value());
    CHECK(lock->bridge_transfer_id == transfer.bridge_transfer_id);
    CHECK(lock->initiator_address == MakeAddress(0xa0, 32));
    CHECK(lock->recipient_address == MakeAddress(0xb0, 32));
    CHECK(lock->hash_lock == transfer.hash_lock);
    CHECK(lock->time_lock == transfer.time_lock);
    CHECK(lock->amount == 250);
  }

  SECTION("Towards chain 1") {
    DirectedConverter directed(converter, ChainSide::Chain1);
    CHECK(directed.destination() == ChainSide::Chain1);
    auto lock = directed.ToLockDetails(MakeTransfer(2, 1000, 32));
    REQUIRE(lock.has_value());
    CHECK(lock->initiator_address.size() == 20);
  }

  SECTION("Any unconvertible field fails the whole record") {
    DirectedConverter directed(converter, ChainSide::Chain2);
    auto transfer = MakeTransfer(3, 1000, 20);
    transfer.recipient_address = MakeAddress(0xb0, 32);
    CHECK_FALSE(directed.ToLockDetails(transfer).has_value());
  }
}
