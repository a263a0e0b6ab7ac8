/**
 * @file Synthesize.cpp
 * @brief Implementation of computed-value synthesis
 */

#include "mocksynth/Synthesize.hpp"
#include "mocksynth/Convert.hpp"
#include "mocksynth/Errors.hpp"

#include <set>
#include <string>

namespace mocksynth {

namespace {

constexpr const char* kInvalidReplacement = "Invalid replacement value";

/**
 * @brief State of a single synthesize() call
 */
struct Context {
    RandomSource& random;
    const SourceRange& range;
    Diagnostics diagnostics;

    // A replacement is broadcast over collection elements, so the same
    // problem would otherwise be reported once per element.
    std::set<std::string> reported;

    void report(const Path& path, std::string detail) {
        if (!reported.insert(detail).second) return;

        Diagnostic diag;
        diag.severity = Severity::Error;
        diag.summary = kInvalidReplacement;
        diag.detail = std::move(detail);
        diag.path = path;
        diag.subject = range;
        diagnostics.append(std::move(diag));
    }
};

Value target_attr(const Value& target, const std::string& name, const Type& type) {
    if (target.is_object() && target.has_attr(name)) {
        return target.get_attr(name);
    }
    return Value::null(type);
}

/// Non-null replacement attribute, or nullptr.
const Value* replacement_attr(const Value* replacement, const std::string& name) {
    if (replacement == nullptr || !replacement->is_object() || !replacement->has_attr(name)) {
        return nullptr;
    }
    const Value& attr = replacement->get_attr(name);
    return attr.is_null() ? nullptr : &attr;
}

Value merge_block(Context& ctx, const Value& target, const Value* replacement,
                  const Block& block, const Path& path);

Value merge_leaf(Context& ctx, const Attribute& attr, const Value& target,
                 const Value* replacement, const Path& path) {
    if (!attr.computed || !target.is_null()) {
        return target;
    }

    if (replacement != nullptr) {
        try {
            return convert(*replacement, attr.type);
        } catch (const ConversionError& err) {
            ctx.report(path,
                       "Terraform could not replace the target type " +
                       attr.type.friendly_name() +
                       " with the replacement value defined at " +
                       path.attribute_string() + " within " +
                       ctx.range.to_string() + ": " + err.what() + ".");
        }
    }

    return ctx.random.generate(attr.type);
}

Value merge_nested(Context& ctx, const Value& target, const Value* replacement,
                   const Block& child, NestingMode nesting, const Path& path) {
    if (replacement != nullptr && !replacement->is_object()) {
        ctx.report(path,
                   "Terraform expected an object type at " + path.attribute_string() +
                   " within the replacement value defined at " + ctx.range.to_string() +
                   ", but found " + replacement->type().friendly_name() + ".");
        replacement = nullptr;
    }

    const Type object_type = child.implied_type();

    switch (nesting) {
        case NestingMode::Single:
            return merge_block(ctx, target, replacement, child, path);

        case NestingMode::List:
        case NestingMode::Set: {
            Value::Elements out;
            const bool matches = nesting == NestingMode::List ? target.is_list()
                                                              : target.is_set();
            if (matches) {
                out.reserve(target.size());
                size_t index = 0;
                for (const auto& elem : target.elements()) {
                    out.push_back(merge_block(ctx, elem, replacement, child,
                                              path.element(index)));
                    ++index;
                }
            }
            return nesting == NestingMode::List ? Value::list(object_type, std::move(out))
                                                : Value::set(object_type, std::move(out));
        }

        case NestingMode::Map: {
            Value::Entries out;
            if (target.is_map()) {
                for (const auto& [key, elem] : target.entries()) {
                    out.emplace(key, merge_block(ctx, elem, replacement, child,
                                                 path.key(key)));
                }
            }
            return Value::map(object_type, std::move(out));
        }
    }
    return merge_block(ctx, target, replacement, child, path);
}

Value merge_block(Context& ctx, const Value& target, const Value* replacement,
                  const Block& block, const Path& path) {
    Value::Entries out;

    for (const auto& [name, attr] : block.attributes()) {
        const Path attr_path = path.attribute(name);
        const Value t = target_attr(target, name, attr.implied_type());
        const Value* r = replacement_attr(replacement, name);

        if (attr.nested_type) {
            out.emplace(name, merge_nested(ctx, t, r, attr.nested_type->attributes,
                                           attr.nested_type->nesting, attr_path));
        } else {
            out.emplace(name, merge_leaf(ctx, attr, t, r, attr_path));
        }
    }

    for (const auto& [name, nested] : block.block_types()) {
        const Path block_path = path.attribute(name);
        const Value t = target_attr(target, name, nested.implied_type());
        const Value* r = replacement_attr(replacement, name);
        const Block empty;

        out.emplace(name, merge_nested(ctx, t, r, nested.block ? *nested.block : empty,
                                       nested.nesting, block_path));
    }

    return Value::object(std::move(out));
}

} // namespace

SynthesisResult synthesize(const Value& target, const ReplacementValue& replacement,
                           const Block& schema, RandomSource& random) {
    Context ctx{random, replacement.range, {}, {}};

    const Value* with = nullptr;
    if (replacement.value.has_value() && !replacement.value->is_null()) {
        if (replacement.value->type().is_object()) {
            with = &*replacement.value;
        } else {
            Diagnostic diag;
            diag.severity = Severity::Error;
            diag.summary = kInvalidReplacement;
            diag.detail = "The requested replacement value must be an object type, but was " +
                          replacement.value->type().friendly_name() + ".";
            diag.subject = replacement.range;
            ctx.diagnostics.append(std::move(diag));
        }
    }

    Value merged = merge_block(ctx, target, with, schema, Path());
    return SynthesisResult{std::move(merged), std::move(ctx.diagnostics)};
}

SynthesisResult synthesize(const Value& target, const ReplacementValue& replacement,
                           const Block& schema) {
    return synthesize(target, replacement, schema, RandomSource::process_default());
}

} // namespace mocksynth
