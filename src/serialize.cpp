// SPDX-License-Identifier: MIT
// Blockforge - Wire Format Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/serialize.hpp"
#include "blockforge/config.hpp"
#include "blockforge/utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace blockforge
{

namespace
{
void
put_u32 (Bytes &v, uint32_t x)
{
  for (int i = 0; i < 4; ++i)
    v.push_back (static_cast<uint8_t> ((x >> (i * 8)) & 0xff));
}

void
put_u64 (Bytes &v, uint64_t x)
{
  for (int i = 0; i < 8; ++i)
    v.push_back (static_cast<uint8_t> ((x >> (i * 8)) & 0xff));
}

void
put_var_bytes (Bytes &v, const Bytes &b)
{
  write_compact_size (v, b.size ());
  v.insert (v.end (), b.begin (), b.end ());
}

/// Bounds-checked cursor over an input buffer
class Reader
{
public:
  explicit Reader (const Bytes &data) : data_ (data) {}

  uint8_t
  u8 ()
  {
    need (1, "u8");
    return data_[pos_++];
  }

  uint32_t
  u32 ()
  {
    need (4, "u32");
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x |= static_cast<uint32_t> (data_[pos_++]) << (i * 8);
    return x;
  }

  uint64_t
  u64 ()
  {
    need (8, "u64");
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x |= static_cast<uint64_t> (data_[pos_++]) << (i * 8);
    return x;
  }

  uint64_t
  compact_size ()
  {
    uint8_t tag = u8 ();
    if (tag < 0xfd)
      return tag;
    if (tag == 0xfd)
      {
        need (2, "u16");
        uint64_t x = data_[pos_] | (static_cast<uint64_t> (data_[pos_ + 1]) << 8);
        pos_ += 2;
        return x;
      }
    if (tag == 0xfe)
      return u32 ();
    return u64 ();
  }

  Hash256
  hash ()
  {
    need (32, "hash");
    Hash256 h;
    std::copy (data_.begin () + pos_, data_.begin () + pos_ + 32, h.begin ());
    pos_ += 32;
    return h;
  }

  Bytes
  var_bytes ()
  {
    uint64_t len = compact_size ();
    need (len, "script");
    Bytes out (data_.begin () + pos_, data_.begin () + pos_ + len);
    pos_ += len;
    return out;
  }

  void
  expect_end () const
  {
    if (pos_ != data_.size ())
      throw std::runtime_error ("decode: "
                                + std::to_string (data_.size () - pos_)
                                + " trailing bytes");
  }

private:
  void
  need (uint64_t n, const char *what) const
  {
    if (n > data_.size () - pos_)
      throw std::runtime_error (std::string ("decode: truncated ") + what
                                + " at offset " + std::to_string (pos_));
  }

  const Bytes &data_;
  size_t pos_ = 0;
};

void
write_transaction (Bytes &v, const Transaction &tx)
{
  put_u32 (v, tx.version);

  write_compact_size (v, tx.inputs.size ());
  for (const auto &in : tx.inputs)
    {
      v.insert (v.end (), in.previous_output_hash.begin (),
                in.previous_output_hash.end ());
      put_u32 (v, in.previous_output_index);
      put_var_bytes (v, in.unlocking_script);
      put_u32 (v, in.sequence);
    }

  write_compact_size (v, tx.outputs.size ());
  for (const auto &out : tx.outputs)
    {
      put_u64 (v, out.value);
      put_var_bytes (v, out.guard_script);
    }

  put_u32 (v, tx.lock_time);
}

Transaction
read_transaction (Reader &r)
{
  Transaction tx;
  tx.version = r.u32 ();

  uint64_t n_in = r.compact_size ();
  for (uint64_t k = 0; k < n_in; ++k)
    {
      TxIn in;
      in.previous_output_hash = r.hash ();
      in.previous_output_index = r.u32 ();
      in.unlocking_script = r.var_bytes ();
      in.sequence = r.u32 ();
      tx.inputs.push_back (std::move (in));
    }

  uint64_t n_out = r.compact_size ();
  for (uint64_t k = 0; k < n_out; ++k)
    {
      TxOut out;
      out.value = r.u64 ();
      out.guard_script = r.var_bytes ();
      tx.outputs.push_back (std::move (out));
    }

  tx.lock_time = r.u32 ();
  return tx;
}

BlockHeader
read_header (Reader &r)
{
  BlockHeader h;
  h.version = r.u32 ();
  h.previous_block_hash = r.hash ();
  h.merkle_root = r.hash ();
  h.timestamp = r.u32 ();
  h.difficulty_bits = r.u32 ();
  h.nonce = r.u32 ();
  return h;
}
}

void
write_compact_size (Bytes &out, uint64_t value)
{
  if (value < 0xfd)
    {
      out.push_back (static_cast<uint8_t> (value));
    }
  else if (value <= 0xffff)
    {
      out.push_back (0xfd);
      out.push_back (static_cast<uint8_t> (value & 0xff));
      out.push_back (static_cast<uint8_t> ((value >> 8) & 0xff));
    }
  else if (value <= 0xffffffff)
    {
      out.push_back (0xfe);
      put_u32 (out, static_cast<uint32_t> (value));
    }
  else
    {
      out.push_back (0xff);
      put_u64 (out, value);
    }
}

Bytes
encode_transaction (const Transaction &tx)
{
  Bytes v;
  v.reserve (10 + tx.inputs.size () * 150 + tx.outputs.size () * 40);
  write_transaction (v, tx);
  return v;
}

Transaction
decode_transaction (const Bytes &data)
{
  Reader r (data);
  Transaction tx = read_transaction (r);
  r.expect_end ();
  return tx;
}

Bytes
encode_header (const BlockHeader &header)
{
  Bytes v;
  v.reserve (constants::BLOCK_HEADER_SIZE);
  put_u32 (v, header.version);
  v.insert (v.end (), header.previous_block_hash.begin (),
            header.previous_block_hash.end ());
  v.insert (v.end (), header.merkle_root.begin (), header.merkle_root.end ());
  put_u32 (v, header.timestamp);
  put_u32 (v, header.difficulty_bits);
  put_u32 (v, header.nonce);
  return v;
}

Bytes
encode_block (const Block &block)
{
  Bytes v = encode_header (block.header);
  write_compact_size (v, block.transactions.size ());
  for (const auto &tx : block.transactions)
    write_transaction (v, tx);
  return v;
}

Block
decode_block (const Bytes &data)
{
  Reader r (data);
  Block block;
  block.header = read_header (r);
  uint64_t n_tx = r.compact_size ();
  for (uint64_t k = 0; k < n_tx; ++k)
    block.transactions.push_back (read_transaction (r));
  r.expect_end ();
  return block;
}

Hash256
transaction_hash (const Transaction &tx)
{
  return sha256d (encode_transaction (tx));
}

Hash256
block_hash (const BlockHeader &header)
{
  return sha256d (encode_header (header));
}

} // namespace blockforge
