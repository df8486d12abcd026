#pragma once

/**
 * @file proof_tree.hpp
 * @brief Arena-backed proof tree: Entity -> Proof Item -> Proof Attempt
 *
 * Nodes are addressed by stable indices into a single arena. Every node holds
 * a closed tagged union of its payload, the index of its parent and the
 * ordered indices of its children. The tree is append-only.
 */

#include "proofrank/common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace proofrank::tree {

using NodeIndex = std::uint32_t;

/**
 * Prover outcome as reported in a proof attempt.
 * Only kValid counts as a success; everything else is a failure.
 */
enum class Outcome : std::uint8_t {
    kValid,
    kInvalid,
    kTimeout,
    kUnknown,
    kStepLimit,
    kOutOfMemory,
    kFailure,
    kOther,
};

[[nodiscard]] Outcome parse_outcome(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

struct Entity
{
    std::string name;
    std::string report_file;  ///< File key: stem of the report the entity was read from
};

struct ProofItem
{
    std::string source_file;
    int line = 0;
    int column = 0;
    std::string rule;
    std::string severity;
};

struct Attempt
{
    std::string prover;
    Outcome outcome = Outcome::kUnknown;
    double time = 0.0;        ///< Elapsed seconds
    std::uint64_t steps = 0;  ///< Raw prover-reported steps
};

enum class NodeKind : std::uint8_t { kEntity, kProofItem, kAttempt };

using Payload = std::variant<Entity, ProofItem, Attempt>;

struct Node
{
    Payload payload;
    std::optional<NodeIndex> parent;
    std::vector<NodeIndex> children;
};

class ProofTree
{
public:
    NodeIndex add_entity(Entity entity);

    /**
     * @brief Append a proof item below an entity
     * @return Index of the new node, or InvalidParent if entity is not an Entity node
     */
    [[nodiscard]] Result<NodeIndex> add_proof_item(NodeIndex entity, ProofItem item);

    /**
     * @brief Append a proof attempt below a proof item
     * @return Index of the new node, or InvalidParent if item is not a ProofItem node
     */
    [[nodiscard]] Result<NodeIndex> add_attempt(NodeIndex item, Attempt attempt);

    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_nodes.empty(); }

    /// Root entities in insertion order
    [[nodiscard]] std::span<const NodeIndex> entities() const noexcept { return m_entities; }

    [[nodiscard]] NodeKind kind(NodeIndex index) const;
    [[nodiscard]] std::span<const NodeIndex> children(NodeIndex index) const;
    [[nodiscard]] std::optional<NodeIndex> parent(NodeIndex index) const;

    // Typed accessors throw std::logic_error on a kind mismatch.
    [[nodiscard]] const Entity& entity(NodeIndex index) const;
    [[nodiscard]] const ProofItem& proof_item(NodeIndex index) const;
    [[nodiscard]] const Attempt& attempt(NodeIndex index) const;

    template <typename Visitor>
    decltype(auto) visit(NodeIndex index, Visitor&& visitor) const
    {
        return std::visit(std::forward<Visitor>(visitor), node(index).payload);
    }

private:
    [[nodiscard]] const Node& node(NodeIndex index) const;
    [[nodiscard]] bool holds(NodeIndex index, NodeKind expected) const noexcept;
    [[nodiscard]] NodeIndex next_index() const;

    std::vector<Node> m_nodes;
    std::vector<NodeIndex> m_entities;
};

}  // namespace proofrank::tree
