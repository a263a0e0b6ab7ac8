#include "mocksynth/Random.hpp"

namespace mocksynth {

namespace {
    constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    constexpr size_t kAlphabetSize = sizeof(kAlphabet) - 1;
}

RandomSource& RandomSource::process_default() {
    static RandomSource instance{std::random_device{}()};
    return instance;
}

std::string RandomSource::next_string(size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out += kAlphabet[engine_() % kAlphabetSize];
    }
    return out;
}

Value RandomSource::generate(const Type& type) {
    switch (type.kind()) {
        case TypeKind::String:
            return Value::string(next_string());
        case TypeKind::Number:
            return Value::number(0);
        case TypeKind::Bool:
            return Value::boolean(false);
        case TypeKind::List:
            return Value::empty_list(type.element_type());
        case TypeKind::Set:
            return Value::empty_set(type.element_type());
        case TypeKind::Map:
            return Value::empty_map(type.element_type());
        case TypeKind::Object: {
            Value::Entries attrs;
            for (const auto& [name, attr_type] : type.attribute_types()) {
                attrs.emplace(name, generate(attr_type));
            }
            return Value::object(std::move(attrs));
        }
        case TypeKind::Dynamic:
            break;
    }
    return Value::null(type);
}

} // namespace mocksynth
