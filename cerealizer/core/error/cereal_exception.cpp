#include "cereal_exception.h"

namespace {
std::string format_conversion_message(ConversionError::Kind kind, const std::string& detail, const std::string& path) {
    std::string msg(ConversionError::kind_name(kind));
    if (!path.empty()) {
        msg += " at ";
        msg += path;
    }
    msg += ": ";
    msg += detail;
    return msg;
}
}

ClassNotFound::ClassNotFound(std::string class_name)
    : CerealException("Failed to get runtime cerealizer: no class registered as '" + class_name + "'"),
      class_name_(std::move(class_name)) {}

ConversionError::ConversionError(Kind kind, std::string detail, std::string path)
    : CerealException(format_conversion_message(kind, detail, path)),
      kind_(kind), detail_(std::move(detail)), path_(std::move(path)) {}

ConversionError ConversionError::with_prefix(std::string_view segment) const {
    std::string path(segment);
    if (!path_.empty()) {
        if (path_.front() != '[') path += '.';
        path += path_;
    }
    return ConversionError(kind_, detail_, std::move(path));
}

std::string_view ConversionError::kind_name(Kind kind) {
    switch (kind) {
    case Kind::TypeMismatch: return "type mismatch";
    case Kind::MissingField: return "missing field";
    case Kind::MalformedScalar: return "malformed scalar";
    }
    return "conversion error";
}
