/**
 * @file Path.hpp
 * @brief Traversal paths and source ranges for diagnostics
 *
 * A Path is an immutable, append-only list of steps from the root of a
 * value tree:
 * - Attribute step: object attribute or nested block name
 * - Index step: position inside a list or set
 * - Key step: key inside a map
 *
 * Appending returns a new Path; the receiver is never modified, so paths
 * can be threaded through recursive calls by value.
 *
 * Rendering:
 * - to_string():          nested[0].id, tags["one"].id
 * - attribute_string():   nested.id (attribute steps only, dot-joined)
 */

#ifndef MOCKSYNTH_PATH_HPP
#define MOCKSYNTH_PATH_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace mocksynth {

/**
 * @brief One step of a Path
 */
struct PathStep {
    enum class Kind {
        Attribute,
        Index,
        Key
    };

    Kind kind = Kind::Attribute;
    std::string name;   // attribute name or map key
    size_t index = 0;   // list/set position

    static PathStep attribute(std::string name) {
        return PathStep{Kind::Attribute, std::move(name), 0};
    }
    static PathStep element(size_t index) {
        return PathStep{Kind::Index, std::string(), index};
    }
    static PathStep key(std::string key) {
        return PathStep{Kind::Key, std::move(key), 0};
    }

    bool operator==(const PathStep& other) const {
        return kind == other.kind && name == other.name && index == other.index;
    }
    bool operator!=(const PathStep& other) const { return !(*this == other); }
};

class Path {
public:
    Path() = default;

    /// New path with an attribute step appended.
    Path attribute(const std::string& name) const;
    /// New path with a list/set index step appended.
    Path element(size_t index) const;
    /// New path with a map key step appended.
    Path key(const std::string& key) const;

    const std::vector<PathStep>& steps() const noexcept { return steps_; }
    bool empty() const noexcept { return steps_.empty(); }
    size_t size() const noexcept { return steps_.size(); }

    /**
     * @brief Full rendering including index and key steps
     *
     * Examples:
     * - [attr "a", attr "b"]            -> "a.b"
     * - [attr "block", index 1, attr "id"] -> "block[1].id"
     * - [attr "m", key "k"]             -> "m[\"k\"]"
     * - []                              -> ""
     */
    std::string to_string() const;

    /**
     * @brief Only the attribute steps, joined with dots
     *
     * Replacement values are addressed by attribute name alone (one
     * replacement object applies to every element of a collection), so
     * this is the form used when pointing into a replacement.
     */
    std::string attribute_string() const;

    bool operator==(const Path& other) const { return steps_ == other.steps_; }
    bool operator!=(const Path& other) const { return !(*this == other); }

private:
    std::vector<PathStep> steps_;
};

/**
 * @brief Split a dot-path into attribute segments
 *
 * Examples:
 * - "database.host" -> ["database", "host"]
 * - "" -> []
 * - "a..b" -> ["a", "b"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join segments with dots
 *
 * - ["a", "b", "c"] -> "a.b.c"
 * - [] -> ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Path made of attribute steps parsed from a dot-path
 */
Path path_from_dots(const std::string& dotted);

/**
 * @brief A position in a source file
 */
struct SourcePos {
    int line = 0;
    int column = 0;
    int byte = 0;

    bool operator==(const SourcePos& other) const {
        return line == other.line && column == other.column && byte == other.byte;
    }
};

/**
 * @brief A span of a source file, used to attribute diagnostics
 */
struct SourceRange {
    std::string filename;
    SourcePos start;
    SourcePos end;

    /**
     * @brief Render as "file:line,col-col" or "file:line,col-line,col"
     *
     * The zero range renders as ":0,0-0".
     */
    std::string to_string() const;

    bool operator==(const SourceRange& other) const {
        return filename == other.filename && start == other.start && end == other.end;
    }
};

} // namespace mocksynth

#endif // MOCKSYNTH_PATH_HPP
