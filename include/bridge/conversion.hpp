// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/types.hpp"
#include <memory>
#include <optional>

namespace swaprelay {
namespace bridge {

enum class ChainSide { Chain1, Chain2 };

/**
 * ChainConverter - data mapping between the two chains of a relay pair
 *
 * Addresses (and, for some pairs, hash-locks) have different concrete
 * representations on each chain. One implementation exists per chain pair.
 * An empty optional means the value has no representation on the target
 * chain.
 */
class ChainConverter {
public:
  virtual ~ChainConverter() = default;

  virtual std::optional<BridgeAddress> ToChain1Address(const BridgeAddress& chain2_address) const = 0;
  virtual std::optional<BridgeAddress> ToChain2Address(const BridgeAddress& chain1_address) const = 0;

  // Both sides use 32-byte commitments unless a pair says otherwise
  virtual std::optional<HashLock> ToChain1HashLock(const HashLock& chain2_hash) const {
    return chain2_hash;
  }
  virtual std::optional<HashLock> ToChain2HashLock(const HashLock& chain1_hash) const {
    return chain1_hash;
  }
};

// Both chains share address and hash encodings
class IdentityConverter : public ChainConverter {
public:
  std::optional<BridgeAddress> ToChain1Address(const BridgeAddress& a) const override { return a; }
  std::optional<BridgeAddress> ToChain2Address(const BridgeAddress& a) const override { return a; }
};

/**
 * Fixed-width address mapping, e.g. 20-byte EVM <-> 32-byte Move accounts.
 *
 * Widening left-pads with zero bytes. Narrowing drops leading bytes and
 * fails unless they are all zero. Input of the wrong source width fails.
 */
class AddressWidthConverter : public ChainConverter {
public:
  AddressWidthConverter(size_t chain1_width, size_t chain2_width)
      : chain1_width_(chain1_width), chain2_width_(chain2_width) {}

  std::optional<BridgeAddress> ToChain1Address(const BridgeAddress& a) const override;
  std::optional<BridgeAddress> ToChain2Address(const BridgeAddress& a) const override;

private:
  static std::optional<BridgeAddress> Resize(const BridgeAddress& a, size_t from, size_t to);

  size_t chain1_width_;
  size_t chain2_width_;
};

// Picks IdentityConverter for equal widths, AddressWidthConverter otherwise
std::shared_ptr<const ChainConverter> MakeConverter(size_t chain1_width, size_t chain2_width);

/**
 * DirectedConverter - one relay direction's view of a ChainConverter
 * (always source chain -> destination chain).
 */
class DirectedConverter {
public:
  DirectedConverter(std::shared_ptr<const ChainConverter> converter, ChainSide destination)
      : converter_(std::move(converter)), destination_(destination) {}

  std::optional<BridgeAddress> ConvertAddress(const BridgeAddress& source_address) const;
  std::optional<HashLock> ConvertHashLock(const HashLock& source_hash) const;

  // Lock call arguments for the destination chain, built from the source
  // chain's initiation record
  std::optional<LockDetails> ToLockDetails(const BridgeTransferDetails& source) const;

  ChainSide destination() const { return destination_; }

private:
  std::shared_ptr<const ChainConverter> converter_;
  ChainSide destination_;
};

} // namespace bridge
} // namespace swaprelay
