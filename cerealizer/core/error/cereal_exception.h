#ifndef CEREAL_EXCEPTION_H
#define CEREAL_EXCEPTION_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// Base of everything the cerealizer library throws.
class CerealException : public std::runtime_error {
public:
    explicit CerealException(const std::string& message) : std::runtime_error(message) {}
};

// A converter could not be created for a type: the tagged cerealizer class is
// not default constructible or its constructor threw, or the type was never
// registered with ClassDB.
class ConstructionError : public CerealException {
public:
    explicit ConstructionError(const std::string& message) : CerealException(message) {}
};

// A "--class" discriminator named a type that ClassDB does not know.
class ClassNotFound : public CerealException {
public:
    explicit ClassNotFound(std::string class_name);

    const std::string& class_name() const { return class_name_; }

private:
    std::string class_name_;
};

// The cereal (or the instance) does not have the shape a converter expects.
class ConversionError : public CerealException {
public:
    enum class Kind : uint8_t {
        TypeMismatch,    ///< e.g. expected object, got array
        MissingField,    ///< required member absent from the object
        MalformedScalar, ///< out of range number, bad base64, unknown enum name
    };

    ConversionError(Kind kind, std::string detail, std::string path = {});

    Kind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }
    // Location inside the converted value, e.g. "children[0].name". Empty at the root.
    const std::string& path() const { return path_; }

    // Copy of this error located one level further out: "name" + "[0]" etc.
    ConversionError with_prefix(std::string_view segment) const;

    static std::string_view kind_name(Kind kind);

private:
    Kind kind_;
    std::string detail_;
    std::string path_;
};

#endif
