#include "crypto/signing_key.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::crypto {

namespace {

// RFC 6979 retries are astronomically rare; bound them anyway.
constexpr int kMaxNonceAttempts = 64;

struct BnFree {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxFree {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct PointFree {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
struct GroupFree {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnFree>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxFree>;
using PointPtr = std::unique_ptr<EC_POINT, PointFree>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupFree>;

void Check(int status, const char* what) {
  if (status != 1) {
    const unsigned long code = ERR_get_error();
    std::string message = std::string("libcrypto ") + what + " failed";
    if (code != 0) {
      char buf[256];
      ERR_error_string_n(code, buf, sizeof(buf));
      message += std::string(": ") + buf;
    }
    ERR_clear_error();
    throw std::runtime_error(message);
  }
}

// Per-call curve state; EC_GROUP and BN_CTX are not shared across threads.
class Curve {
 public:
  Curve()
      : group_(EC_GROUP_new_by_curve_name(NID_secp256k1)),
        ctx_(BN_CTX_new()),
        order_(BN_new()),
        half_order_(BN_new()),
        field_(BN_new()) {
    if (!group_ || !ctx_ || !order_ || !half_order_ || !field_) {
      throw std::runtime_error("secp256k1 is unavailable in libcrypto");
    }
    Check(EC_GROUP_get_order(group_.get(), order_.get(), ctx_.get()), "EC_GROUP_get_order");
    Check(BN_rshift1(half_order_.get(), order_.get()), "BN_rshift1");
    Check(EC_GROUP_get_curve(group_.get(), field_.get(), nullptr, nullptr, ctx_.get()),
          "EC_GROUP_get_curve");
  }

  const EC_GROUP* group() const { return group_.get(); }
  BN_CTX* ctx() const { return ctx_.get(); }
  const BIGNUM* order() const { return order_.get(); }
  const BIGNUM* half_order() const { return half_order_.get(); }
  const BIGNUM* field() const { return field_.get(); }

  BnPtr NewBn() const {
    BnPtr bn(BN_new());
    if (!bn) {
      throw std::runtime_error("BN_new failed");
    }
    return bn;
  }

  BnPtr FromBytes(std::span<const std::uint8_t> bytes) const {
    BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
    if (!bn) {
      throw std::runtime_error("BN_bin2bn failed");
    }
    return bn;
  }

  PointPtr NewPoint() const {
    PointPtr point(EC_POINT_new(group_.get()));
    if (!point) {
      throw std::runtime_error("EC_POINT_new failed");
    }
    return point;
  }

  bool InScalarRange(const BIGNUM* value) const {
    return !BN_is_zero(value) && BN_cmp(value, order_.get()) < 0;
  }

  std::array<std::uint8_t, kPublicKeyBytes> Serialize(const EC_POINT* point) const {
    std::array<std::uint8_t, kPublicKeyBytes> out{};
    const std::size_t written = EC_POINT_point2oct(group_.get(), point,
                                                   POINT_CONVERSION_UNCOMPRESSED, out.data(),
                                                   out.size(), ctx_.get());
    if (written != out.size()) {
      throw std::runtime_error("EC_POINT_point2oct failed");
    }
    return out;
  }

 private:
  GroupPtr group_;
  BnCtxPtr ctx_;
  BnPtr order_;
  BnPtr half_order_;
  BnPtr field_;
};

std::array<std::uint8_t, 32> ToBytes32(const BIGNUM* value) {
  std::array<std::uint8_t, 32> out{};
  if (BN_bn2binpad(value, out.data(), static_cast<int>(out.size())) != 32) {
    throw std::runtime_error("scalar does not fit in 32 bytes");
  }
  return out;
}

std::optional<RecoverableSignature> SignWithNonce(const Curve& curve, const BIGNUM* secret,
                                                  const BIGNUM* z, const BIGNUM* nonce) {
  PointPtr r_point = curve.NewPoint();
  Check(EC_POINT_mul(curve.group(), r_point.get(), nonce, nullptr, nullptr, curve.ctx()),
        "EC_POINT_mul");
  BnPtr x = curve.NewBn();
  BnPtr y = curve.NewBn();
  Check(EC_POINT_get_affine_coordinates(curve.group(), r_point.get(), x.get(), y.get(),
                                        curve.ctx()),
        "EC_POINT_get_affine_coordinates");

  std::uint8_t recovery_id = BN_is_odd(y.get()) ? 1 : 0;
  if (BN_cmp(x.get(), curve.order()) >= 0) {
    recovery_id |= 2;
  }
  BnPtr r = curve.NewBn();
  Check(BN_nnmod(r.get(), x.get(), curve.order(), curve.ctx()), "BN_nnmod");
  if (BN_is_zero(r.get())) {
    return std::nullopt;
  }

  BnPtr nonce_inverse(BN_mod_inverse(nullptr, nonce, curve.order(), curve.ctx()));
  if (!nonce_inverse) {
    throw std::runtime_error("BN_mod_inverse failed");
  }
  // s = k^-1 (z + r * d) mod n
  BnPtr s = curve.NewBn();
  Check(BN_mod_mul(s.get(), r.get(), secret, curve.order(), curve.ctx()), "BN_mod_mul");
  Check(BN_mod_add(s.get(), s.get(), z, curve.order(), curve.ctx()), "BN_mod_add");
  Check(BN_mod_mul(s.get(), s.get(), nonce_inverse.get(), curve.order(), curve.ctx()),
        "BN_mod_mul");
  if (BN_is_zero(s.get())) {
    return std::nullopt;
  }
  if (BN_cmp(s.get(), curve.half_order()) > 0) {
    Check(BN_sub(s.get(), curve.order(), s.get()), "BN_sub");
    recovery_id ^= 1;
  }

  RecoverableSignature signature;
  signature.r = ToBytes32(r.get());
  signature.s = ToBytes32(s.get());
  signature.recovery_id = recovery_id;
  return signature;
}

std::vector<std::uint8_t> Rfc6979Input(const std::array<std::uint8_t, 32>& v,
                                       std::uint8_t separator,
                                       std::span<const std::uint8_t> secret,
                                       const std::array<std::uint8_t, 32>& h1) {
  std::vector<std::uint8_t> input(v.begin(), v.end());
  input.push_back(separator);
  input.insert(input.end(), secret.begin(), secret.end());
  input.insert(input.end(), h1.begin(), h1.end());
  return input;
}

}  // namespace

bool IsValidSecretKey(std::span<const std::uint8_t> secret) {
  if (secret.size() != kSecretKeyBytes) {
    return false;
  }
  const Curve curve;
  const BnPtr value = curve.FromBytes(secret);
  return curve.InScalarRange(value.get());
}

bool AddSecretKeys(std::span<const std::uint8_t> secret, std::span<const std::uint8_t> tweak,
                   std::array<std::uint8_t, kSecretKeyBytes>* out) {
  if (secret.size() != kSecretKeyBytes || tweak.size() != kSecretKeyBytes) {
    return false;
  }
  const Curve curve;
  BnPtr sum = curve.FromBytes(secret);
  BN_set_flags(sum.get(), BN_FLG_CONSTTIME);
  const BnPtr addend = curve.FromBytes(tweak);
  if (!curve.InScalarRange(sum.get()) || BN_cmp(addend.get(), curve.order()) >= 0) {
    return false;
  }
  Check(BN_mod_add(sum.get(), sum.get(), addend.get(), curve.order(), curve.ctx()),
        "BN_mod_add");
  if (BN_is_zero(sum.get())) {
    return false;
  }
  *out = ToBytes32(sum.get());
  return true;
}

SigningKey::SigningKey(std::vector<std::uint8_t> secret, std::vector<std::uint8_t> public_key)
    : secret_(std::move(secret)), public_key_(std::move(public_key)) {}

SigningKey::~SigningKey() { util::SecureWipe(secret_); }

SigningKey::SigningKey(SigningKey&& other) noexcept = default;

SigningKey& SigningKey::operator=(SigningKey&& other) noexcept {
  if (this != &other) {
    util::SecureWipe(secret_);
    secret_ = std::move(other.secret_);
    public_key_ = std::move(other.public_key_);
  }
  return *this;
}

SigningKey SigningKey::FromSecret(std::span<const std::uint8_t> secret) {
  if (!IsValidSecretKey(secret)) {
    throw std::invalid_argument("secp256k1 secret key out of range");
  }
  const Curve curve;
  BnPtr scalar = curve.FromBytes(secret);
  BN_set_flags(scalar.get(), BN_FLG_CONSTTIME);
  PointPtr point = curve.NewPoint();
  Check(EC_POINT_mul(curve.group(), point.get(), scalar.get(), nullptr, nullptr, curve.ctx()),
        "EC_POINT_mul");
  const auto encoded = curve.Serialize(point.get());
  return SigningKey(std::vector<std::uint8_t>(secret.begin(), secret.end()),
                    std::vector<std::uint8_t>(encoded.begin(), encoded.end()));
}

std::array<std::uint8_t, kCompressedPublicKeyBytes> SigningKey::CompressedPublicKey() const {
  std::array<std::uint8_t, kCompressedPublicKeyBytes> out{};
  out[0] = static_cast<std::uint8_t>(0x02 | (public_key_[kPublicKeyBytes - 1] & 1));
  std::copy(public_key_.begin() + 1, public_key_.begin() + 33, out.begin() + 1);
  return out;
}

RecoverableSignature SigningKey::SignDigest(const Digest32& digest) const {
  const Curve curve;
  BnPtr secret = curve.FromBytes(secret_);
  BN_set_flags(secret.get(), BN_FLG_CONSTTIME);
  BnPtr z = curve.FromBytes(digest);
  Check(BN_nnmod(z.get(), z.get(), curve.order(), curve.ctx()), "BN_nnmod");
  const auto h1 = ToBytes32(z.get());

  std::array<std::uint8_t, 32> v{};
  std::array<std::uint8_t, 32> k{};
  v.fill(0x01);
  for (const std::uint8_t separator : {std::uint8_t{0x00}, std::uint8_t{0x01}}) {
    auto input = Rfc6979Input(v, separator, secret_, h1);
    k = util::HmacSha256(k, input);
    util::SecureWipe(input);
    v = util::HmacSha256(k, v);
  }

  for (int attempt = 0; attempt < kMaxNonceAttempts; ++attempt) {
    v = util::HmacSha256(k, v);
    BnPtr nonce = curve.FromBytes(v);
    BN_set_flags(nonce.get(), BN_FLG_CONSTTIME);
    if (curve.InScalarRange(nonce.get())) {
      if (auto signature = SignWithNonce(curve, secret.get(), z.get(), nonce.get())) {
        util::SecureWipe(k);
        util::SecureWipe(v);
        return *signature;
      }
    }
    std::vector<std::uint8_t> retry(v.begin(), v.end());
    retry.push_back(0x00);
    k = util::HmacSha256(k, retry);
    v = util::HmacSha256(k, v);
  }
  util::SecureWipe(k);
  util::SecureWipe(v);
  throw std::runtime_error("could not derive a usable signing nonce");
}

std::optional<std::array<std::uint8_t, kPublicKeyBytes>> RecoverPublicKey(
    const Digest32& digest, const RecoverableSignature& signature) {
  if (signature.recovery_id > 3) {
    return std::nullopt;
  }
  const Curve curve;
  const BnPtr r = curve.FromBytes(signature.r);
  const BnPtr s = curve.FromBytes(signature.s);
  if (!curve.InScalarRange(r.get()) || !curve.InScalarRange(s.get())) {
    return std::nullopt;
  }

  BnPtr x = curve.NewBn();
  if (BN_copy(x.get(), r.get()) == nullptr) {
    throw std::runtime_error("BN_copy failed");
  }
  if (signature.recovery_id & 2) {
    Check(BN_add(x.get(), x.get(), curve.order()), "BN_add");
  }
  if (BN_cmp(x.get(), curve.field()) >= 0) {
    return std::nullopt;
  }
  PointPtr r_point = curve.NewPoint();
  if (EC_POINT_set_compressed_coordinates(curve.group(), r_point.get(), x.get(),
                                          signature.recovery_id & 1, curve.ctx()) != 1) {
    ERR_clear_error();
    return std::nullopt;
  }

  // Q = r^-1 (s R - z G)
  BnPtr z = curve.FromBytes(digest);
  Check(BN_nnmod(z.get(), z.get(), curve.order(), curve.ctx()), "BN_nnmod");
  BnPtr r_inverse(BN_mod_inverse(nullptr, r.get(), curve.order(), curve.ctx()));
  if (!r_inverse) {
    throw std::runtime_error("BN_mod_inverse failed");
  }
  BnPtr zero = curve.NewBn();
  BN_zero(zero.get());
  BnPtr u1 = curve.NewBn();
  Check(BN_mod_sub(u1.get(), zero.get(), z.get(), curve.order(), curve.ctx()), "BN_mod_sub");
  Check(BN_mod_mul(u1.get(), u1.get(), r_inverse.get(), curve.order(), curve.ctx()),
        "BN_mod_mul");
  BnPtr u2 = curve.NewBn();
  Check(BN_mod_mul(u2.get(), s.get(), r_inverse.get(), curve.order(), curve.ctx()),
        "BN_mod_mul");

  PointPtr q = curve.NewPoint();
  Check(EC_POINT_mul(curve.group(), q.get(), u1.get(), r_point.get(), u2.get(), curve.ctx()),
        "EC_POINT_mul");
  if (EC_POINT_is_at_infinity(curve.group(), q.get())) {
    return std::nullopt;
  }
  return curve.Serialize(q.get());
}

}  // namespace rootsave::crypto
