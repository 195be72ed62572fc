#include "dice.h"

#include "game_errors.h"

#include <algorithm>
#include <cctype>
#include <exception>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace {

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace

Digest256 sha256(const std::uint8_t* data, std::size_t size) {
    Digest256 out{};
    unsigned int outLen = 0;
    if (EVP_Digest(data, size, out.data(), &outLen, EVP_sha256(), nullptr) != 1 || outLen != out.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}

Digest256 sha256(const std::string& text) {
    return sha256(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::string sha256Hex(const std::string& text) {
    return digestToHex(sha256(text));
}

Digest256 hmacSha256(const Digest256& key, const std::string& message) {
    Digest256 out{};
    unsigned int outLen = 0;
    const unsigned char* mac = HMAC(EVP_sha256(),
                                    key.data(), static_cast<int>(key.size()),
                                    reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                    out.data(), &outLen);
    if (!mac || outLen != out.size()) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return out;
}

std::string bytesToHex(const std::uint8_t* data, std::size_t size) {
    static const char* kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string digestToHex(const Digest256& digest) {
    return bytesToHex(digest.data(), digest.size());
}

bool hexToBytes(const std::string& hex, std::vector<std::uint8_t>& out) {
    out.clear();
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexNibble(hex[i]);
        const int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}

Digest256 combineSeed(const std::string& blockHash, const std::string& clientSeed) {
    return sha256(blockHash + clientSeed);
}

int deriveRoll(const Digest256& combinedSeed, const std::string& label, int dieSize) {
    if (dieSize <= 0) {
        throw PreconditionViolation("die size must be positive for roll '" + label + "'");
    }
    const Digest256 mac = hmacSha256(combinedSeed, label);
    // First four bytes, big-endian.
    const std::uint32_t value = (static_cast<std::uint32_t>(mac[0]) << 24) |
                                (static_cast<std::uint32_t>(mac[1]) << 16) |
                                (static_cast<std::uint32_t>(mac[2]) << 8) |
                                static_cast<std::uint32_t>(mac[3]);
    return static_cast<int>(value % static_cast<std::uint32_t>(dieSize)) + 1;
}

void deriveRolls(const Digest256& combinedSeed, std::vector<RollRequest>& requests) {
    const int count = static_cast<int>(requests.size());
    std::vector<std::exception_ptr> errors(requests.size());

    // Exceptions must not leave the parallel region; park them per request.
    #pragma omp parallel for
    for (int i = 0; i < count; ++i) {
        RollRequest& r = requests[static_cast<std::size_t>(i)];
        try {
            r.result = deriveRoll(combinedSeed, r.label, r.dieSize);
        } catch (...) {
            errors[static_cast<std::size_t>(i)] = std::current_exception();
        }
    }

    for (const std::exception_ptr& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}

int deriveDice(const std::string& blockHash, const std::string& clientSeed, const std::string& label, int dieSize) {
    return deriveRoll(combineSeed(blockHash, clientSeed), label, dieSize);
}

std::string generateClientSeed() {
    std::array<std::uint8_t, 32> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("CSPRNG unavailable for client seed generation");
    }
    return bytesToHex(bytes.data(), bytes.size());
}

std::string commitmentHash(const std::string& clientSeed) {
    return sha256Hex(clientSeed);
}

bool verifyCommitment(const std::string& clientSeed, const std::string& committedHash) {
    return commitmentHash(clientSeed) == toLowerAscii(committedHash);
}

int statModifierFromTotal(int total) {
    const int diff = total - 13;
    // Integer division truncates toward zero; round odd negatives down.
    return (diff >= 0) ? diff / 2 : -((-diff + 1) / 2);
}
