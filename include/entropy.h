#pragma once

#include <cstdint>
#include <string>

struct BlockInfo {
    std::int64_t height = 0;
    std::string hash;
};

// Seed material for one entropy slot: local seed plus the external block.
struct EntropyBundle {
    std::string clientSeed;
    std::int64_t blockHeight = 0;
    std::string blockHash;
};

// Supplier of external block entropy. Network-backed sources live outside
// this library; the engine only ever sees the resulting EntropyBundle.
class EntropySource {
public:
    virtual ~EntropySource() = default;

    virtual std::int64_t currentHeight() const = 0;
    // Throws MissingInput for a height that has not been produced yet.
    virtual BlockInfo blockAt(std::int64_t height) const = 0;
    virtual BlockInfo waitForHeight(std::int64_t height) = 0;
};

// Offline source: hash(h) = sha256Hex("<baseSeed>:<h>"). Waiting simply
// moves the tip forward.
class SyntheticEntropySource : public EntropySource {
public:
    SyntheticEntropySource(std::string baseSeed, std::int64_t startHeight);

    std::int64_t currentHeight() const override { return m_height; }
    BlockInfo blockAt(std::int64_t height) const override;
    BlockInfo waitForHeight(std::int64_t height) override;

private:
    std::string m_baseSeed;
    std::int64_t m_height = 0;
};

struct Commitment {
    std::string clientSeed;
    std::string commitmentHash;
    std::int64_t targetHeight = 0;
};

Commitment createCommitment(std::int64_t targetHeight);
Commitment createCommitment(const std::string& clientSeed, std::int64_t targetHeight);

// Waits for the target block and pairs it with the committed seed.
// Throws PreconditionViolation when the seed does not match its commitment.
EntropyBundle revealCommitment(const Commitment& commitment, EntropySource& source);
