#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wgp {

// Append-only event journal with a binary SHA-256 Merkle tree over its entries.
class TranscriptLog {
public:
    void append(const std::string& event);
    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& events() const { return events_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string leafHash(const std::string& event);
    static bool verifyProof(const std::string& leaf,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }
    bool empty() const { return leaves_.empty(); }

private:
    static std::string hash(const std::string& data);
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> events_;
    std::vector<std::string> leaves_;
};

} // namespace wgp
