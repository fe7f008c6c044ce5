#include "crypto/secp256k1.hpp"

#include <algorithm>
#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

namespace autopay::crypto {

namespace {

struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct PointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
struct GroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};

using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
struct EcKeyDeleter {
  void operator()(EC_KEY* key) const { EC_KEY_free(key); }
};
struct EcdsaSigDeleter {
  void operator()(ECDSA_SIG* sig) const { ECDSA_SIG_free(sig); }
};

using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using EcKeyPtr = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

// Scratch state shared by every curve operation in one call.
struct Curve {
  GroupPtr group;
  BnCtxPtr ctx;
  const BIGNUM* order{nullptr};

  bool Init() {
    group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
    ctx.reset(BN_CTX_new());
    if (!group || !ctx) {
      return false;
    }
    order = EC_GROUP_get0_order(group.get());
    return order != nullptr;
  }
};

BnPtr NewBn() { return BnPtr(BN_new()); }

BnPtr BnFromBytes(std::span<const std::uint8_t> bytes) {
  return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

bool BnToArray(const BIGNUM* bn, std::array<std::uint8_t, 32>* out) {
  return BN_bn2binpad(bn, out->data(), static_cast<int>(out->size())) == 32;
}

bool PointToPublicKey(const Curve& curve, const EC_POINT* point, PublicKey* out) {
  std::array<std::uint8_t, 65> encoded{};
  const auto len = EC_POINT_point2oct(curve.group.get(), point, POINT_CONVERSION_UNCOMPRESSED,
                                      encoded.data(), encoded.size(), curve.ctx.get());
  if (len != encoded.size() || encoded[0] != 0x04) {
    return false;
  }
  std::copy(encoded.begin() + 1, encoded.end(), out->begin());
  return true;
}

}  // namespace

std::array<std::uint8_t, kRecoverableSignatureSize> RecoverableSignature::Serialize() const {
  std::array<std::uint8_t, kRecoverableSignatureSize> out{};
  std::copy(r.begin(), r.end(), out.begin());
  std::copy(s.begin(), s.end(), out.begin() + 32);
  out[64] = static_cast<std::uint8_t>(27 + recovery_id);
  return out;
}

bool IsValidPrivateKey(std::span<const std::uint8_t> key) {
  if (key.size() != kPrivateKeySize) {
    return false;
  }
  Curve curve;
  if (!curve.Init()) {
    return false;
  }
  auto d = BnFromBytes(key);
  if (!d) {
    return false;
  }
  return !BN_is_zero(d.get()) && BN_cmp(d.get(), curve.order) < 0;
}

std::optional<PublicKey> DerivePublicKey(const PrivateKey& key) {
  if (!IsValidPrivateKey(key)) {
    return std::nullopt;
  }
  Curve curve;
  if (!curve.Init()) {
    return std::nullopt;
  }
  auto d = BnFromBytes(key);
  PointPtr point(EC_POINT_new(curve.group.get()));
  if (d) {
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);
  }
  if (!d || !point ||
      EC_POINT_mul(curve.group.get(), point.get(), d.get(), nullptr, nullptr,
                   curve.ctx.get()) != 1) {
    return std::nullopt;
  }
  PublicKey out{};
  if (!PointToPublicKey(curve, point.get(), &out)) {
    return std::nullopt;
  }
  return out;
}

std::optional<RecoverableSignature> SignDigest(const PrivateKey& key, const Hash256& digest) {
  const auto public_key = DerivePublicKey(key);
  if (!public_key) {
    return std::nullopt;
  }
  Curve curve;
  if (!curve.Init()) {
    return std::nullopt;
  }
  auto d = BnFromBytes(key);
  EcKeyPtr ec_key(EC_KEY_new_by_curve_name(NID_secp256k1));
  if (!d || !ec_key) {
    return std::nullopt;
  }
  BN_set_flags(d.get(), BN_FLG_CONSTTIME);
  std::array<std::uint8_t, 65> encoded{0x04};
  std::copy(public_key->begin(), public_key->end(), encoded.begin() + 1);
  PointPtr point(EC_POINT_new(curve.group.get()));
  if (!point ||
      EC_POINT_oct2point(curve.group.get(), point.get(), encoded.data(), encoded.size(),
                         curve.ctx.get()) != 1 ||
      EC_KEY_set_private_key(ec_key.get(), d.get()) != 1 ||
      EC_KEY_set_public_key(ec_key.get(), point.get()) != 1) {
    return std::nullopt;
  }

  EcdsaSigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), ec_key.get()));
  if (!sig) {
    return std::nullopt;
  }
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  auto half_order = NewBn();
  auto low_s = NewBn();
  if (!half_order || !low_s || BN_rshift1(half_order.get(), curve.order) != 1 ||
      BN_copy(low_s.get(), s) == nullptr) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), curve.order, low_s.get()) != 1) {
    return std::nullopt;
  }

  RecoverableSignature out;
  if (!BnToArray(r, &out.r) || !BnToArray(low_s.get(), &out.s)) {
    return std::nullopt;
  }
  // The library does not report R's parity, so find the id that recovers our key.
  for (std::uint8_t id = 0; id < 4; ++id) {
    out.recovery_id = id;
    if (RecoverPublicKey(digest, out) == public_key) {
      return out;
    }
  }
  return std::nullopt;
}

std::optional<PublicKey> RecoverPublicKey(const Hash256& digest,
                                          const RecoverableSignature& signature) {
  if (signature.recovery_id > 3) {
    return std::nullopt;
  }
  Curve curve;
  if (!curve.Init()) {
    return std::nullopt;
  }
  auto* group = curve.group.get();
  auto* ctx = curve.ctx.get();
  auto r = BnFromBytes(signature.r);
  auto s = BnFromBytes(signature.s);
  auto e = BnFromBytes(digest);
  auto x = NewBn();
  auto r_inv = NewBn();
  auto u1 = NewBn();
  auto u2 = NewBn();
  PointPtr big_r(EC_POINT_new(group));
  PointPtr q(EC_POINT_new(group));
  if (!r || !s || !e || !x || !r_inv || !u1 || !u2 || !big_r || !q) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_is_zero(s.get()) || BN_cmp(r.get(), curve.order) >= 0 ||
      BN_cmp(s.get(), curve.order) >= 0) {
    return std::nullopt;
  }

  if (BN_copy(x.get(), r.get()) == nullptr) {
    return std::nullopt;
  }
  if ((signature.recovery_id & 2) != 0 && BN_add(x.get(), x.get(), curve.order) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_set_compressed_coordinates(group, big_r.get(), x.get(),
                                          signature.recovery_id & 1, ctx) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 * (s*R - e*G) = (-e * r^-1) * G + (s * r^-1) * R
  if (BN_mod_inverse(r_inv.get(), r.get(), curve.order, ctx) == nullptr ||
      BN_nnmod(e.get(), e.get(), curve.order, ctx) != 1 ||
      BN_mod_sub(u1.get(), curve.order, e.get(), curve.order, ctx) != 1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inv.get(), curve.order, ctx) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inv.get(), curve.order, ctx) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_mul(group, q.get(), u1.get(), big_r.get(), u2.get(), ctx) != 1 ||
      EC_POINT_is_at_infinity(group, q.get()) == 1) {
    return std::nullopt;
  }
  PublicKey out{};
  if (!PointToPublicKey(curve, q.get(), &out)) {
    return std::nullopt;
  }
  return out;
}

}  // namespace autopay::crypto
