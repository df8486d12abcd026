/**
 * @file proof_tree.cpp
 * @brief Arena-backed proof tree
 */

#include "proofrank/proof_tree.hpp"

#include <format>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace proofrank::tree {

namespace {

[[nodiscard]] std::string_view kind_name(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::kEntity:
            return "Entity";
        case NodeKind::kProofItem:
            return "ProofItem";
        case NodeKind::kAttempt:
            return "Attempt";
    }
    return "Node";
}

[[nodiscard]] NodeKind kind_of(const Payload& payload) noexcept
{
    return static_cast<NodeKind>(payload.index());
}

}  // namespace

Outcome parse_outcome(std::string_view text) noexcept
{
    if (text == "Valid") {
        return Outcome::kValid;
    }
    if (text == "Invalid") {
        return Outcome::kInvalid;
    }
    if (text == "Timeout") {
        return Outcome::kTimeout;
    }
    if (text == "Unknown") {
        return Outcome::kUnknown;
    }
    if (text == "StepLimitExceeded" || text == "Steplimitexceeded") {
        return Outcome::kStepLimit;
    }
    if (text == "OutOfMemory") {
        return Outcome::kOutOfMemory;
    }
    if (text == "Failure" || text == "HighFailure") {
        return Outcome::kFailure;
    }
    return Outcome::kOther;
}

std::string_view to_string(Outcome outcome) noexcept
{
    switch (outcome) {
        case Outcome::kValid:
            return "Valid";
        case Outcome::kInvalid:
            return "Invalid";
        case Outcome::kTimeout:
            return "Timeout";
        case Outcome::kUnknown:
            return "Unknown";
        case Outcome::kStepLimit:
            return "StepLimitExceeded";
        case Outcome::kOutOfMemory:
            return "OutOfMemory";
        case Outcome::kFailure:
            return "Failure";
        case Outcome::kOther:
            return "Other";
    }
    return "Other";
}

NodeIndex ProofTree::next_index() const
{
    if (m_nodes.size() >= std::numeric_limits<NodeIndex>::max()) {
        throw std::length_error("proof tree node limit reached");
    }
    return static_cast<NodeIndex>(m_nodes.size());
}

NodeIndex ProofTree::add_entity(Entity entity)
{
    const NodeIndex index = next_index();
    m_nodes.push_back(Node{.payload = std::move(entity), .parent = std::nullopt, .children = {}});
    m_entities.push_back(index);
    return index;
}

Result<NodeIndex> ProofTree::add_proof_item(NodeIndex entity, ProofItem item)
{
    if (!holds(entity, NodeKind::kEntity)) {
        return std::unexpected(Error::make(
            "InvalidParent", std::format("proof item parent {} is not an Entity node", entity)));
    }
    const NodeIndex index = next_index();
    m_nodes.push_back(Node{.payload = std::move(item), .parent = entity, .children = {}});
    m_nodes[entity].children.push_back(index);
    return index;
}

Result<NodeIndex> ProofTree::add_attempt(NodeIndex item, Attempt attempt)
{
    if (!holds(item, NodeKind::kProofItem)) {
        return std::unexpected(Error::make(
            "InvalidParent", std::format("proof attempt parent {} is not a ProofItem node", item)));
    }
    const NodeIndex index = next_index();
    m_nodes.push_back(Node{.payload = std::move(attempt), .parent = item, .children = {}});
    m_nodes[item].children.push_back(index);
    return index;
}

NodeKind ProofTree::kind(NodeIndex index) const
{
    return kind_of(node(index).payload);
}

std::span<const NodeIndex> ProofTree::children(NodeIndex index) const
{
    return node(index).children;
}

std::optional<NodeIndex> ProofTree::parent(NodeIndex index) const
{
    return node(index).parent;
}

const Entity& ProofTree::entity(NodeIndex index) const
{
    const auto* payload = std::get_if<Entity>(&node(index).payload);
    if (payload == nullptr) {
        throw std::logic_error(std::format("node {} is a {}, expected Entity",
                                           index,
                                           kind_name(kind(index))));
    }
    return *payload;
}

const ProofItem& ProofTree::proof_item(NodeIndex index) const
{
    const auto* payload = std::get_if<ProofItem>(&node(index).payload);
    if (payload == nullptr) {
        throw std::logic_error(std::format("node {} is a {}, expected ProofItem",
                                           index,
                                           kind_name(kind(index))));
    }
    return *payload;
}

const Attempt& ProofTree::attempt(NodeIndex index) const
{
    const auto* payload = std::get_if<Attempt>(&node(index).payload);
    if (payload == nullptr) {
        throw std::logic_error(std::format("node {} is a {}, expected Attempt",
                                           index,
                                           kind_name(kind(index))));
    }
    return *payload;
}

const Node& ProofTree::node(NodeIndex index) const
{
    if (index >= m_nodes.size()) {
        throw std::logic_error(
            std::format("node index {} out of range (size {})", index, m_nodes.size()));
    }
    return m_nodes[index];
}

bool ProofTree::holds(NodeIndex index, NodeKind expected) const noexcept
{
    return index < m_nodes.size() && kind_of(m_nodes[index].payload) == expected;
}

}  // namespace proofrank::tree
