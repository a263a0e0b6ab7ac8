/**
 * @file Schema.hpp
 * @brief Schema model: blocks, attributes and nesting
 *
 * A Block is an ordered set of attributes and an ordered set of nested
 * block types. Declaration order is preserved and is the order in which
 * synthesis visits fields.
 *
 * Nesting can happen two ways:
 * - Attribute-level: an Attribute with a NestedObject (its own attribute
 *   set plus a nesting mode)
 * - Block-level: a NestedBlock wrapping a child Block plus a nesting mode
 *
 * Schemas are assumed to be well-formed (unique names, attribute and
 * block names not colliding). Nothing here validates that.
 */

#ifndef MOCKSYNTH_SCHEMA_HPP
#define MOCKSYNTH_SCHEMA_HPP

#include "mocksynth/Type.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mocksynth {

/**
 * @brief Container shape of a nested structure
 *
 * - Single: a bare object
 * - List: ordered sequence of objects
 * - Set: unordered set of objects
 * - Map: string-keyed map of objects
 */
enum class NestingMode {
    Single,
    List,
    Set,
    Map
};

/// "single", "list", "set" or "map"
std::string nesting_mode_name(NestingMode mode);

/**
 * @brief Wrap an object type in the container a nesting mode demands
 */
Type nest_type(const Type& object_type, NestingMode mode);

class Block;
struct NestedObject;

struct Attribute {
    Type type;
    bool computed = false;
    bool optional = false;
    bool required = false;
    bool sensitive = false;
    std::string description;

    /// Set for attribute-level nesting; `type` is then ignored.
    std::shared_ptr<const NestedObject> nested_type;

    /**
     * @brief Type of the value this attribute holds
     *
     * For nested attributes this is derived from the nested attribute set
     * and nesting mode.
     */
    Type implied_type() const;
};

struct NestedBlock {
    std::shared_ptr<const Block> block;
    NestingMode nesting = NestingMode::Single;
    int min_items = 0;
    int max_items = 0;

    Type implied_type() const;
};

class Block {
public:
    using NamedAttribute = std::pair<std::string, Attribute>;
    using NamedBlock = std::pair<std::string, NestedBlock>;

    Block() = default;

    /// Append an attribute; returns *this for chaining.
    Block& add_attribute(const std::string& name, Attribute attribute);
    /// Append a nested block type; returns *this for chaining.
    Block& add_block(const std::string& name, NestedBlock block);

    const std::vector<NamedAttribute>& attributes() const noexcept { return attributes_; }
    const std::vector<NamedBlock>& block_types() const noexcept { return block_types_; }

    /// nullptr when no attribute has that name.
    const Attribute* find_attribute(const std::string& name) const;
    /// nullptr when no nested block has that name.
    const NestedBlock* find_block(const std::string& name) const;

    bool empty() const noexcept { return attributes_.empty() && block_types_.empty(); }

    /**
     * @brief Object type with one attribute per schema field
     */
    Type implied_type() const;

private:
    std::vector<NamedAttribute> attributes_;
    std::vector<NamedBlock> block_types_;
};

struct NestedObject {
    Block attributes;   // attributes only; block_types stay empty
    NestingMode nesting = NestingMode::Single;
};

// ============================================================================
// Construction helpers
// ============================================================================

/// Plain attribute of the given type.
Attribute make_attribute(const Type& type, bool computed = false);

/// Attribute-level nesting over `attributes`.
Attribute make_nested_attribute(Block attributes, NestingMode nesting);

/// Block-level nesting over `block`.
NestedBlock make_nested_block(Block block, NestingMode nesting);

} // namespace mocksynth

#endif // MOCKSYNTH_SCHEMA_HPP
