#include "transcript_log.hpp"

#include "picosha2.h"

#include <utility>
#include <vector>

namespace wgp {

namespace {

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace

void TranscriptLog::append(const std::string& event) {
    events_.push_back(event);
    leaves_.push_back(hashBytes(event));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::leafHash(const std::string& event) {
    return hashBytes(event);
}

std::string TranscriptLog::hash(const std::string& data) {
    return hashBytes(data);
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return hash(left + right);
}

std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            if (i + 1 < layer.size()) {
                next.push_back(hashPair(layer[i], layer[i + 1]));
            } else {
                next.push_back(hashPair(layer[i], layer[i]));
            }
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;

    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);

        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(left, right));

            if (i == index || i + 1 == index) {
                proof.push_back(i == index ? right : left);
                index = next.size() - 1;
            }
        }

        layer = std::move(next);
    }

    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leaf,
                                std::size_t leafIndex,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    if (leaf.empty() || root.empty()) {
        return false;
    }
    std::string node = leaf;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        node = (index % 2 == 0) ? hashPair(node, sibling) : hashPair(sibling, node);
        index /= 2;
    }
    return index == 0 && node == root;
}

} // namespace wgp
