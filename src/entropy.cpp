#include "entropy.h"

#include "dice.h"
#include "game_errors.h"

#include <algorithm>
#include <utility>

SyntheticEntropySource::SyntheticEntropySource(std::string baseSeed, std::int64_t startHeight)
    : m_baseSeed(std::move(baseSeed)),
      m_height(startHeight) {}

BlockInfo SyntheticEntropySource::blockAt(std::int64_t height) const {
    if (height > m_height) {
        throw MissingInput("block " + std::to_string(height) + " not produced yet (tip " + std::to_string(m_height) + ")");
    }
    BlockInfo b;
    b.height = height;
    b.hash = sha256Hex(m_baseSeed + ":" + std::to_string(height));
    return b;
}

BlockInfo SyntheticEntropySource::waitForHeight(std::int64_t height) {
    m_height = std::max(m_height, height);
    return blockAt(height);
}

Commitment createCommitment(std::int64_t targetHeight) {
    return createCommitment(generateClientSeed(), targetHeight);
}

Commitment createCommitment(const std::string& clientSeed, std::int64_t targetHeight) {
    Commitment c;
    c.clientSeed = clientSeed;
    c.commitmentHash = commitmentHash(clientSeed);
    c.targetHeight = targetHeight;
    return c;
}

EntropyBundle revealCommitment(const Commitment& commitment, EntropySource& source) {
    if (!verifyCommitment(commitment.clientSeed, commitment.commitmentHash)) {
        throw PreconditionViolation("client seed does not match its commitment");
    }
    const BlockInfo block = source.waitForHeight(commitment.targetHeight);
    EntropyBundle bundle;
    bundle.clientSeed = commitment.clientSeed;
    bundle.blockHeight = block.height;
    bundle.blockHash = block.hash;
    return bundle;
}
