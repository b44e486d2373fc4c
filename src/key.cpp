// SPDX-License-Identifier: MIT
// Blockforge - secp256k1 Signing Keys Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/key.hpp"
#include "blockforge/config.hpp"
#include "blockforge/utils.hpp"
#include <memory>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <stdexcept>
#include <utility>

namespace blockforge
{

void
KeyDeleter::operator() (EC_KEY *key) const
{
  EC_KEY_free (key);
}

namespace
{
struct BnDeleter
{
  void
  operator() (BIGNUM *bn) const
  {
    BN_clear_free (bn);
  }
};

struct BnCtxDeleter
{
  void
  operator() (BN_CTX *ctx) const
  {
    BN_CTX_free (ctx);
  }
};

struct PointDeleter
{
  void
  operator() (EC_POINT *p) const
  {
    EC_POINT_free (p);
  }
};

struct SigDeleter
{
  void
  operator() (ECDSA_SIG *sig) const
  {
    ECDSA_SIG_free (sig);
  }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

KeyPtr
new_curve_key ()
{
  KeyPtr key (EC_KEY_new_by_curve_name (NID_secp256k1));
  if (!key)
    throw std::runtime_error ("EC_KEY_new_by_curve_name failed");
  return key;
}

Bytes
encode_point (const EC_KEY *key, bool compressed)
{
  const EC_GROUP *group = EC_KEY_get0_group (key);
  const EC_POINT *point = EC_KEY_get0_public_key (key);
  auto form = compressed ? POINT_CONVERSION_COMPRESSED
                         : POINT_CONVERSION_UNCOMPRESSED;
  size_t len = EC_POINT_point2oct (group, point, form, nullptr, 0, nullptr);
  if (len == 0)
    throw std::runtime_error ("EC_POINT_point2oct failed");
  Bytes out (len);
  if (EC_POINT_point2oct (group, point, form, out.data (), len, nullptr)
      != len)
    throw std::runtime_error ("EC_POINT_point2oct failed");
  return out;
}

// Replace s with n - s when s > n/2 so signatures are not malleable
void
normalize_low_s (const EC_GROUP *group, SigPtr &sig)
{
  const BIGNUM *r = nullptr;
  const BIGNUM *s = nullptr;
  ECDSA_SIG_get0 (sig.get (), &r, &s);

  const BIGNUM *order = EC_GROUP_get0_order (group);
  BnPtr half (BN_dup (order));
  if (!half || BN_rshift1 (half.get (), half.get ()) != 1)
    throw std::runtime_error ("BN_rshift1 failed");
  if (BN_cmp (s, half.get ()) <= 0)
    return;

  BnPtr new_s (BN_new ());
  BnPtr new_r (BN_dup (r));
  if (!new_s || !new_r || BN_sub (new_s.get (), order, s) != 1)
    throw std::runtime_error ("BN_sub failed");

  SigPtr low (ECDSA_SIG_new ());
  if (!low || ECDSA_SIG_set0 (low.get (), new_r.get (), new_s.get ()) != 1)
    throw std::runtime_error ("ECDSA_SIG_set0 failed");
  new_r.release ();
  new_s.release ();
  sig = std::move (low);
}
}

SigningKey::SigningKey (KeyPtr key, bool compressed)
    : key_ (std::move (key)), pubkey_ (encode_point (key_.get (), compressed))
{
}

SigningKey
SigningKey::generate (bool compressed)
{
  KeyPtr key = new_curve_key ();
  if (EC_KEY_generate_key (key.get ()) != 1)
    throw std::runtime_error ("EC_KEY_generate_key failed");
  return SigningKey (std::move (key), compressed);
}

SigningKey
SigningKey::from_secret (const Bytes &secret, bool compressed)
{
  if (secret.size () != 32)
    throw std::invalid_argument ("secret must be 32 bytes");

  KeyPtr key = new_curve_key ();
  const EC_GROUP *group = EC_KEY_get0_group (key.get ());

  BnPtr priv (BN_bin2bn (secret.data (), static_cast<int> (secret.size ()),
                         nullptr));
  if (!priv)
    throw std::runtime_error ("BN_bin2bn failed");
  if (BN_is_zero (priv.get ())
      || BN_cmp (priv.get (), EC_GROUP_get0_order (group)) >= 0)
    throw std::invalid_argument ("secret out of range for secp256k1");

  BnCtxPtr ctx (BN_CTX_new ());
  PointPtr pub (EC_POINT_new (group));
  if (!ctx || !pub
      || EC_POINT_mul (group, pub.get (), priv.get (), nullptr, nullptr,
                       ctx.get ())
             != 1)
    throw std::runtime_error ("EC_POINT_mul failed");
  if (EC_KEY_set_private_key (key.get (), priv.get ()) != 1
      || EC_KEY_set_public_key (key.get (), pub.get ()) != 1)
    throw std::runtime_error ("EC_KEY_set_private_key failed");

  return SigningKey (std::move (key), compressed);
}

Bytes
SigningKey::secret () const
{
  Bytes out (32);
  if (BN_bn2binpad (EC_KEY_get0_private_key (key_.get ()), out.data (), 32)
      != 32)
    throw std::runtime_error ("BN_bn2binpad failed");
  return out;
}

Hash160
SigningKey::pubkey_hash () const
{
  return hash160 (pubkey_);
}

std::string
SigningKey::address () const
{
  auto h = pubkey_hash ();
  return base58check_encode (constants::ADDRESS_VERSION,
                             Bytes (h.begin (), h.end ()));
}

Bytes
SigningKey::sign (const Hash256 &hash) const
{
  SigPtr sig (ECDSA_do_sign (hash.data (), static_cast<int> (hash.size ()),
                             key_.get ()));
  if (!sig)
    throw std::runtime_error ("ECDSA_do_sign failed");
  normalize_low_s (EC_KEY_get0_group (key_.get ()), sig);

  int der_len = i2d_ECDSA_SIG (sig.get (), nullptr);
  if (der_len <= 0)
    throw std::runtime_error ("i2d_ECDSA_SIG failed");
  Bytes der (static_cast<size_t> (der_len));
  unsigned char *p = der.data ();
  if (i2d_ECDSA_SIG (sig.get (), &p) != der_len)
    throw std::runtime_error ("i2d_ECDSA_SIG failed");
  return der;
}

bool
verify_signature (const Bytes &pubkey, const Bytes &der, const Hash256 &hash)
{
  if (pubkey.empty () || der.empty ())
    return false;

  KeyPtr key (EC_KEY_new_by_curve_name (NID_secp256k1));
  if (!key)
    return false;
  EC_KEY *raw = key.get ();
  const unsigned char *kp = pubkey.data ();
  if (!o2i_ECPublicKey (&raw, &kp, static_cast<long> (pubkey.size ())))
    return false;

  const unsigned char *sp = der.data ();
  SigPtr sig (d2i_ECDSA_SIG (nullptr, &sp, static_cast<long> (der.size ())));
  if (!sig)
    return false;
  // Reject trailing garbage after the DER sequence
  if (sp != der.data () + der.size ())
    return false;

  return ECDSA_do_verify (hash.data (), static_cast<int> (hash.size ()),
                          sig.get (), key.get ())
         == 1;
}

} // namespace blockforge
