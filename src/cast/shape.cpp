#include "etfcast/cast/shape.hpp"

namespace etfcast::cast {
    const char* shape_name(TargetShape shape) noexcept {
        switch (shape) {
        case TargetShape::Unsupported:
            return "unsupported";
        case TargetShape::Opaque:
            return "term";
        case TargetShape::Deferred:
            return "uncasted_result";
        case TargetShape::Raw:
            return "raw_data";
        case TargetShape::Atom:
            return "atom";
        case TargetShape::Boolean:
            return "bool";
        case TargetShape::Integer:
            return "integer";
        case TargetShape::Float:
            return "float";
        case TargetShape::Text:
            return "string";
        case TargetShape::Bytes:
            return "bytes";
        case TargetShape::SequenceAny:
            return "term_list";
        case TargetShape::Sequence:
            return "vector";
        case TargetShape::MapAny:
            return "term_map";
        case TargetShape::Map:
            return "map";
        case TargetShape::Record:
            return "record";
        }
        return "unsupported";
    }
} // namespace etfcast::cast
