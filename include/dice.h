#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Provably fair dice: every roll is HMAC-SHA256(combinedSeed, label) so the
// label alone separates independent rolls drawn from the same seed pair.

using Digest256 = std::array<std::uint8_t, 32>;

Digest256 sha256(const std::uint8_t* data, std::size_t size);
Digest256 sha256(const std::string& text);
std::string sha256Hex(const std::string& text);
Digest256 hmacSha256(const Digest256& key, const std::string& message);

std::string bytesToHex(const std::uint8_t* data, std::size_t size);
std::string digestToHex(const Digest256& digest);
// Returns false on odd length or a non-hex character.
bool hexToBytes(const std::string& hex, std::vector<std::uint8_t>& out);

// SHA-256 of the UTF-8 text blockHash + clientSeed.
Digest256 combineSeed(const std::string& blockHash, const std::string& clientSeed);

// Uniform integer in [1, dieSize]. Throws PreconditionViolation for dieSize <= 0.
int deriveRoll(const Digest256& combinedSeed, const std::string& label, int dieSize);
struct RollRequest {
    std::string label;
    int dieSize = 0;
    int result = 0;
};

// Derives every request (in parallel when OpenMP is enabled). Labels are
// independent, so order does not matter. The first failure in request order
// is rethrown once all derivations have finished.
void deriveRolls(const Digest256& combinedSeed, std::vector<RollRequest>& requests);

int deriveDice(const std::string& blockHash, const std::string& clientSeed, const std::string& label, int dieSize);

// Local entropy and its pre-published commitment.
std::string generateClientSeed();
std::string commitmentHash(const std::string& clientSeed);
bool verifyCommitment(const std::string& clientSeed, const std::string& committedHash);

// floor((total - 13) / 2) with mathematical floor for negative totals.
int statModifierFromTotal(int total);
