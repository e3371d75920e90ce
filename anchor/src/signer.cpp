#include "signer.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "rlp.hpp"
#include "util.hpp"
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <memory>
#include <cctype>

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using KeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using SigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

BnPtr bn(BIGNUM* p) { return BnPtr(p, &BN_free); }
PointPtr point(const EC_GROUP* group) { return PointPtr(EC_POINT_new(group), &EC_POINT_free); }

Bytes bn_to_32(const BIGNUM* value) {
    Bytes out(32, 0);
    BN_bn2binpad(value, out.data(), 32);
    return out;
}

Bytes strip_leading_zeros(const Bytes& b) {
    size_t i = 0;
    while (i < b.size() && b[i] == 0) i++;
    return Bytes(b.begin() + static_cast<long>(i), b.end());
}

std::string address_from_point(const EC_GROUP* group, const EC_POINT* pub, BN_CTX* ctx) {
    uint8_t buf[65];
    size_t n = EC_POINT_point2oct(group, pub, POINT_CONVERSION_UNCOMPRESSED, buf, sizeof(buf), ctx);
    if (n != sizeof(buf)) return "";

    uint8_t h[32];
    digest::keccak_256(buf + 1, 64, h);
    return Signer::to_checksum_address(hex::encode(h + 12, 20));
}

Bytes address_bytes(const std::string& to) {
    if (to.empty()) return Bytes();
    Bytes b = hex::decode(to);
    if (b.size() != 20) {
        throw ValidationError("Recipient must be a 20-byte address: " + to);
    }
    return b;
}

} // namespace

Signer::Signer(const std::string& private_key_hex)
    : key_(nullptr)
{
    Bytes priv;
    try {
        priv = hex::decode(util::trim(private_key_hex));
    } catch (const ValidationError&) {
        throw SigningError("Private key is not valid hex");
    }
    if (priv.size() != 32) {
        OPENSSL_cleanse(priv.data(), priv.size());
        throw SigningError("Private key must be 32 bytes");
    }

    KeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1), &EC_KEY_free);
    BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    auto d = bn(BN_bin2bn(priv.data(), static_cast<int>(priv.size()), nullptr));
    OPENSSL_cleanse(priv.data(), priv.size());
    if (!key || !ctx || !d) {
        throw SigningError("Failed to allocate secp256k1 key");
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), EC_GROUP_get0_order(group)) >= 0) {
        throw SigningError("Private key is outside the secp256k1 range");
    }

    auto pub = point(group);
    if (!pub ||
        EC_KEY_set_private_key(key.get(), d.get()) != 1 ||
        EC_POINT_mul(group, pub.get(), d.get(), nullptr, nullptr, ctx.get()) != 1 ||
        EC_KEY_set_public_key(key.get(), pub.get()) != 1) {
        throw SigningError("Failed to derive public key");
    }

    address_ = address_from_point(group, pub.get(), ctx.get());
    if (address_.empty()) {
        throw SigningError("Failed to derive account address");
    }
    key_ = key.release();
}

Signer::~Signer() {
    if (key_) {
        EC_KEY_free(key_);
    }
}

Signature Signer::sign_hash(const Bytes& hash32) const {
    if (hash32.size() != 32) {
        throw SigningError("Signing hash must be 32 bytes");
    }

    SigPtr sig(ECDSA_do_sign(hash32.data(), 32, key_), &ECDSA_SIG_free);
    if (!sig) {
        throw SigningError("ECDSA_do_sign failed");
    }

    const BIGNUM* r0 = nullptr;
    const BIGNUM* s0 = nullptr;
    ECDSA_SIG_get0(sig.get(), &r0, &s0);

    // Enforce low-s (EIP-2)
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(key_));
    auto s = bn(BN_dup(s0));
    auto half = bn(BN_dup(order));
    if (!s || !half || BN_rshift1(half.get(), half.get()) != 1) {
        throw SigningError("BIGNUM allocation failed");
    }
    if (BN_cmp(s.get(), half.get()) > 0) {
        BN_sub(s.get(), order, s.get());
    }

    Signature out;
    out.r = bn_to_32(r0);
    out.s = bn_to_32(s.get());

    for (int recid = 0; recid < 4; recid++) {
        out.recovery_id = recid;
        if (recover_address(hash32, out) == address_) {
            return out;
        }
    }
    throw SigningError("Could not determine signature recovery id");
}

Bytes Signer::signing_payload(const UnsignedTransaction& tx) {
    return rlp::encode_list({
        rlp::encode_uint(tx.nonce),
        rlp::encode_uint(tx.gas_price),
        rlp::encode_uint(tx.gas_limit),
        rlp::encode_bytes(address_bytes(tx.to)),
        rlp::encode_uint(tx.value),
        rlp::encode_bytes(tx.data),
        rlp::encode_uint(tx.chain_id),
        rlp::encode_uint(0),
        rlp::encode_uint(0)
    });
}

Bytes Signer::signing_hash(const UnsignedTransaction& tx) {
    return digest::keccak_256(signing_payload(tx));
}

SignedTransaction Signer::sign(const UnsignedTransaction& tx) const {
    if (tx.chain_id == 0) {
        throw SigningError("Chain id is required for EIP-155 signing");
    }

    Signature sig = sign_hash(signing_hash(tx));

    SignedTransaction out;
    out.v = tx.chain_id * 2 + 35 + static_cast<uint64_t>(sig.recovery_id);
    out.raw = rlp::encode_list({
        rlp::encode_uint(tx.nonce),
        rlp::encode_uint(tx.gas_price),
        rlp::encode_uint(tx.gas_limit),
        rlp::encode_bytes(address_bytes(tx.to)),
        rlp::encode_uint(tx.value),
        rlp::encode_bytes(tx.data),
        rlp::encode_uint(out.v),
        rlp::encode_bytes(strip_leading_zeros(sig.r)),
        rlp::encode_bytes(strip_leading_zeros(sig.s))
    });
    out.raw_hex = hex::encode(out.raw);
    out.hash = hex::encode(digest::keccak_256(out.raw));
    return out;
}

std::string Signer::recover_address(const Bytes& hash32, const Signature& sig) {
    if (hash32.size() != 32 || sig.r.size() != 32 || sig.s.size() != 32 ||
        sig.recovery_id < 0 || sig.recovery_id > 3) {
        return "";
    }

    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), &EC_GROUP_free);
    BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!group || !ctx) return "";
    const BIGNUM* order = EC_GROUP_get0_order(group.get());

    auto r = bn(BN_bin2bn(sig.r.data(), 32, nullptr));
    auto s = bn(BN_bin2bn(sig.s.data(), 32, nullptr));
    auto e = bn(BN_bin2bn(hash32.data(), 32, nullptr));
    auto x = bn(BN_dup(r.get()));
    auto p = bn(BN_new());
    auto e_neg = bn(BN_new());
    if (!r || !s || !e || !x || !p || !e_neg) return "";
    if (BN_is_zero(r.get()) || BN_is_zero(s.get())) return "";

    if (EC_GROUP_get_curve(group.get(), p.get(), nullptr, nullptr, ctx.get()) != 1) return "";
    if (sig.recovery_id >= 2 && BN_add(x.get(), x.get(), order) != 1) return "";
    if (BN_cmp(x.get(), p.get()) >= 0) return "";

    auto R = point(group.get());
    if (!R || EC_POINT_set_compressed_coordinates(group.get(), R.get(), x.get(),
                                                  sig.recovery_id & 1, ctx.get()) != 1) {
        return "";
    }

    // Q = r^-1 (sR - eG)
    if (BN_nnmod(e.get(), e.get(), order, ctx.get()) != 1) return "";
    if (BN_mod_sub(e_neg.get(), order, e.get(), order, ctx.get()) != 1) return "";
    auto rinv = bn(BN_mod_inverse(nullptr, r.get(), order, ctx.get()));
    if (!rinv) return "";

    auto sr_minus_eg = point(group.get());
    auto q = point(group.get());
    if (!sr_minus_eg || !q) return "";
    if (EC_POINT_mul(group.get(), sr_minus_eg.get(), e_neg.get(), R.get(), s.get(), ctx.get()) != 1) return "";
    if (EC_POINT_mul(group.get(), q.get(), nullptr, sr_minus_eg.get(), rinv.get(), ctx.get()) != 1) return "";
    if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) return "";

    return address_from_point(group.get(), q.get(), ctx.get());
}

std::string Signer::to_checksum_address(const std::string& address) {
    std::string lower = util::to_lower(hex::strip_prefix(address));
    if (lower.size() != 40) {
        throw ValidationError("Address must be 20 bytes: " + address);
    }

    Bytes h = digest::keccak_256(lower);
    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); i++) {
        char c = lower[i];
        int nib = (i % 2 == 0) ? (h[i / 2] >> 4) : (h[i / 2] & 0x0f);
        out += (std::isalpha(static_cast<unsigned char>(c)) && nib >= 8)
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : c;
    }
    return out;
}
