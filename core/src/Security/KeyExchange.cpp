// KeyExchange.cpp — SPAKE2 на OpenSSL EC (P-256)

#include "filett/Security/KeyExchange.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <stdexcept>

namespace FileTT {

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct PointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

constexpr uint32_t MAX_HASH_TO_POINT_ATTEMPTS = 1024;
const char* PASSWORD_SCALAR_INFO = "filett-spake2-pw";

const char* elementSeed(PakeRole role) {
    switch (role) {
        case PakeRole::Initiator: return "filett-spake2-M";
        case PakeRole::Responder: return "filett-spake2-N";
        case PakeRole::Symmetric: return "filett-spake2-S";
        default:                  return "filett-spake2-M";
    }
}

/// Hash-to-point (try-and-increment): x = SHA256(seed ‖ counter), точка 0x02 ‖ x.
/// Дискретный логарифм результата никому не известен.
PointPtr derivePoint(const EC_GROUP* group, const std::string& seed, BN_CTX* ctx) {
    PointPtr point(EC_POINT_new(group));
    if (!point) {
        throw std::runtime_error("EC_POINT_new failed");
    }

    for (uint32_t counter = 0; counter < MAX_HASH_TO_POINT_ATTEMPTS; ++counter) {
        std::vector<uint8_t> input(seed.begin(), seed.end());
        input.push_back(static_cast<uint8_t>(counter >> 24));
        input.push_back(static_cast<uint8_t>(counter >> 16));
        input.push_back(static_cast<uint8_t>(counter >> 8));
        input.push_back(static_cast<uint8_t>(counter));

        auto digest = Crypto::sha256(input);
        std::vector<uint8_t> encoded;
        encoded.reserve(PAKE_POINT_SIZE);
        encoded.push_back(0x02);
        encoded.insert(encoded.end(), digest.begin(), digest.end());

        if (EC_POINT_oct2point(group, point.get(), encoded.data(), encoded.size(), ctx) == 1) {
            return point;
        }
        ERR_clear_error();
    }

    throw std::runtime_error("Failed to derive SPAKE2 element for seed " + seed);
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Impl
// ═══════════════════════════════════════════════════════════

class KeyExchange::Impl {
public:
    enum class Stage { Idle, Started, Finished, Failed };

    Impl(PakeRole role, const std::string& password, const std::string& context)
        : m_role(role) {
        if (password.empty()) {
            throw std::invalid_argument("PAKE password cannot be empty");
        }

        m_group.reset(EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1));
        m_ctx.reset(BN_CTX_new());
        m_order.reset(BN_new());
        if (!m_group || !m_ctx || !m_order ||
            EC_GROUP_get_order(m_group.get(), m_order.get(), m_ctx.get()) != 1) {
            throw std::runtime_error("Failed to initialize P-256 group");
        }

        m_ownElement = derivePoint(m_group.get(), elementSeed(role), m_ctx.get());
        m_peerElement = derivePoint(m_group.get(), elementSeed(pakePeerRole(role)), m_ctx.get());

        std::vector<uint8_t> passwordDigest = Crypto::sha256(password);
        m_passwordHash = SecureBytes(passwordDigest);

        // w = HKDF(password) mod n; 48 байт убирают смещение по модулю
        SecureBytes wide(Crypto::hkdf(passwordDigest, {}, PASSWORD_SCALAR_INFO, 48));
        Crypto::secureZero(passwordDigest.data(), passwordDigest.size());
        m_w.reset(BN_bin2bn(wide.data(), static_cast<int>(wide.size()), nullptr));
        if (!m_w || BN_nnmod(m_w.get(), m_w.get(), m_order.get(), m_ctx.get()) != 1) {
            throw std::runtime_error("Failed to derive password scalar");
        }

        m_contextHash = Crypto::sha256(context);
    }

    ~Impl() {
        clearEphemeral();
    }

    std::vector<uint8_t> start() {
        clearEphemeral();
        m_outbound.clear();
        m_peer.clear();

        m_x.reset(BN_new());
        if (!m_x) {
            throw std::runtime_error("BN_new failed");
        }
        do {
            if (BN_priv_rand_range(m_x.get(), m_order.get()) != 1) {
                throw std::runtime_error("Failed to generate ephemeral scalar");
            }
        } while (BN_is_zero(m_x.get()));

        // T = x·G + w·M_own
        PointPtr t(EC_POINT_new(m_group.get()));
        if (!t || EC_POINT_mul(m_group.get(), t.get(), m_x.get(),
                               m_ownElement.get(), m_w.get(), m_ctx.get()) != 1) {
            throw std::runtime_error("Failed to compute SPAKE2 message");
        }

        std::vector<uint8_t> message(PAKE_MESSAGE_SIZE);
        message[0] = pakeRoleTag(m_role);
        size_t written = EC_POINT_point2oct(m_group.get(), t.get(), POINT_CONVERSION_COMPRESSED,
                                            message.data() + 1, PAKE_POINT_SIZE, m_ctx.get());
        if (written != PAKE_POINT_SIZE) {
            throw std::runtime_error("Failed to encode SPAKE2 message");
        }

        m_outbound = message;
        m_stage = Stage::Started;
        spdlog::debug("KeyExchange: started as {}", pakeRoleToString(m_role));
        return message;
    }

    SecureBytes finish(const std::vector<uint8_t>& peerMessage) {
        if (m_stage == Stage::Idle) {
            fail("finish() called before start()");
        }
        if (m_stage == Stage::Finished) {
            fail("finish() called twice");
        }
        if (m_stage == Stage::Failed) {
            fail("handshake already failed");
        }
        if (peerMessage.size() != PAKE_MESSAGE_SIZE) {
            fail("invalid message length " + std::to_string(peerMessage.size()));
        }
        if (peerMessage[0] != pakeRoleTag(pakePeerRole(m_role))) {
            fail("unexpected peer role byte");
        }
        if (m_role == PakeRole::Symmetric && peerMessage == m_outbound) {
            fail("reflected handshake message");
        }

        PointPtr y(EC_POINT_new(m_group.get()));
        if (!y || EC_POINT_oct2point(m_group.get(), y.get(), peerMessage.data() + 1,
                                     PAKE_POINT_SIZE, m_ctx.get()) != 1) {
            ERR_clear_error();
            fail("invalid group element");
        }
        if (EC_POINT_is_at_infinity(m_group.get(), y.get()) ||
            EC_POINT_is_on_curve(m_group.get(), y.get(), m_ctx.get()) != 1) {
            fail("invalid group element");
        }

        // K = x·(Y − w·M_peer)
        PointPtr unblinded(EC_POINT_new(m_group.get()));
        PointPtr k(EC_POINT_new(m_group.get()));
        if (!unblinded || !k ||
            EC_POINT_mul(m_group.get(), unblinded.get(), nullptr,
                         m_peerElement.get(), m_w.get(), m_ctx.get()) != 1 ||
            EC_POINT_invert(m_group.get(), unblinded.get(), m_ctx.get()) != 1 ||
            EC_POINT_add(m_group.get(), unblinded.get(), y.get(), unblinded.get(), m_ctx.get()) != 1) {
            fail("point arithmetic failed");
        }
        if (EC_POINT_is_at_infinity(m_group.get(), unblinded.get())) {
            fail("degenerate peer element");
        }
        if (EC_POINT_mul(m_group.get(), k.get(), nullptr, unblinded.get(),
                         m_x.get(), m_ctx.get()) != 1) {
            fail("point arithmetic failed");
        }

        SecureBytes kBytes(PAKE_POINT_SIZE);
        if (EC_POINT_point2oct(m_group.get(), k.get(), POINT_CONVERSION_COMPRESSED,
                               kBytes.data(), kBytes.size(), m_ctx.get()) != PAKE_POINT_SIZE) {
            fail("failed to encode shared element");
        }

        const std::vector<uint8_t>* msgA = &m_outbound;
        const std::vector<uint8_t>* msgB = &peerMessage;
        if (m_role == PakeRole::Responder ||
            (m_role == PakeRole::Symmetric && peerMessage < m_outbound)) {
            std::swap(msgA, msgB);
        }

        SecureBytes transcript;
        {
            std::vector<uint8_t> buffer;
            buffer.reserve(2 * Crypto::SHA256_SIZE + 2 * PAKE_MESSAGE_SIZE + PAKE_POINT_SIZE);
            append(buffer, m_passwordHash.bytes());
            append(buffer, m_contextHash);
            append(buffer, *msgA);
            append(buffer, *msgB);
            append(buffer, kBytes.bytes());
            transcript = SecureBytes(std::move(buffer));
        }

        SecureBytes secret(Crypto::sha256(transcript.bytes()));

        m_peer = peerMessage;
        clearEphemeral();
        m_stage = Stage::Finished;
        spdlog::debug("KeyExchange: finished as {}", pakeRoleToString(m_role));
        return secret;
    }

    [[noreturn]] void fail(const std::string& reason) {
        clearEphemeral();
        m_stage = Stage::Failed;
        spdlog::warn("KeyExchange: {}", reason);
        throw ProtocolError("Handshake failed: " + reason);
    }

    void clearEphemeral() {
        m_x.reset();
    }

    PakeRole m_role;
    Stage m_stage = Stage::Idle;

    GroupPtr m_group;
    BnCtxPtr m_ctx;
    BnPtr m_order;
    PointPtr m_ownElement;
    PointPtr m_peerElement;
    BnPtr m_w;
    BnPtr m_x;

    SecureBytes m_passwordHash;
    std::vector<uint8_t> m_contextHash;
    std::vector<uint8_t> m_outbound;
    std::vector<uint8_t> m_peer;
};

// ═══════════════════════════════════════════════════════════
// KeyExchange
// ═══════════════════════════════════════════════════════════

KeyExchange::KeyExchange(PakeRole role, const std::string& password, const std::string& context)
    : m_impl(std::make_unique<Impl>(role, password, context)) {}

KeyExchange::~KeyExchange() = default;

PakeRole KeyExchange::role() const {
    return m_impl->m_role;
}

std::vector<uint8_t> KeyExchange::start() {
    return m_impl->start();
}

SecureBytes KeyExchange::finish(const std::vector<uint8_t>& peerMessage) {
    return m_impl->finish(peerMessage);
}

bool KeyExchange::isStarted() const {
    return m_impl->m_stage == Impl::Stage::Started;
}

bool KeyExchange::isFinished() const {
    return m_impl->m_stage == Impl::Stage::Finished;
}

const std::vector<uint8_t>& KeyExchange::outboundMessage() const {
    return m_impl->m_outbound;
}

const std::vector<uint8_t>& KeyExchange::peerMessage() const {
    return m_impl->m_peer;
}

} // namespace FileTT
