#include "tagattest/sdk/MerkleProof.hpp"
#include "tagattest/sdk/Hashing.hpp"
#include "tagattest/sdk/SecureLogger.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <sstream>
#include <stdexcept>

namespace tagattest {
namespace sdk {

namespace pt = boost::property_tree;

const char* position_to_string(ProofPosition position) {
    return position == ProofPosition::LEFT ? "L" : "R";
}

std::optional<uint64_t> get_unsigned(const pt::ptree& tree, const std::string& path) {
    const std::string text = tree.get<std::string>(path);
    if (text.empty() || text.size() > 20 || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

pt::ptree MerkleProof::to_ptree() const {
    pt::ptree root;
    root.put("leafCount", leaf_count);

    pt::ptree steps_array;
    for (const auto& step : steps) {
        pt::ptree step_node;
        step_node.put("siblingHash", to_hex(step.sibling_hash));
        step_node.put("position", position_to_string(step.position));
        steps_array.push_back(std::make_pair("", step_node));
    }
    root.add_child("steps", steps_array);
    return root;
}

std::string MerkleProof::to_json() const {
    std::ostringstream oss;
    pt::write_json(oss, to_ptree(), false);
    return oss.str();
}

Result<MerkleProof> MerkleProof::from_ptree(const pt::ptree& tree) {
    try {
        MerkleProof proof;
        auto leaf_count = get_unsigned(tree, "leafCount");
        if (!leaf_count) {
            return ErrorCode::MALFORMED_PROOF;
        }
        proof.leaf_count = static_cast<size_t>(*leaf_count);

        const pt::ptree& steps_node = tree.get_child("steps");
        // The writer emits an empty array as ""
        if (steps_node.empty() && !steps_node.data().empty()) {
            return ErrorCode::MALFORMED_PROOF;
        }

        for (const auto& item : steps_node) {
            if (!item.first.empty()) {
                return ErrorCode::MALFORMED_PROOF;
            }

            auto sibling = digest_from_hex(item.second.get<std::string>("siblingHash"));
            if (sibling.is_err()) {
                return ErrorCode::MALFORMED_PROOF;
            }

            const std::string position = item.second.get<std::string>("position");
            ProofStep step;
            step.sibling_hash = sibling.value();
            if (position == "L") {
                step.position = ProofPosition::LEFT;
            } else if (position == "R") {
                step.position = ProofPosition::RIGHT;
            } else {
                return ErrorCode::MALFORMED_PROOF;
            }
            proof.steps.push_back(step);
        }

        return proof;
    } catch (const pt::ptree_error& e) {
        SecureLogger::instance().warning("Rejected proof: " + std::string(e.what()));
        return ErrorCode::MALFORMED_PROOF;
    }
}

Result<MerkleProof> MerkleProof::from_json(const std::string& json) {
    pt::ptree tree;
    try {
        std::istringstream iss(json);
        pt::read_json(iss, tree);
    } catch (const pt::json_parser_error& e) {
        SecureLogger::instance().warning("Proof is not valid JSON: " + std::string(e.what()));
        return ErrorCode::MALFORMED_PROOF;
    }
    return from_ptree(tree);
}

} // namespace sdk
} // namespace tagattest
