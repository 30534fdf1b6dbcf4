#ifndef BYTE_ARRAY_CEREALIZER_H
#define BYTE_ARRAY_CEREALIZER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "cerealizer/function/convert/cerealizer.h"

// std::vector<std::uint8_t> as standard, padded base64 text.
class ByteArrayCerealizer : public TypedCerealizer<std::vector<std::uint8_t>> {
    CEREALIZER_DEF(ByteArrayCerealizer)
public:
    static std::string encode(const std::vector<std::uint8_t>& bytes);
    // throws ConversionError(MalformedScalar) on anything that is not base64
    static std::vector<std::uint8_t> decode(std::string_view text);

protected:
    CerealValue to_cereal_typed(const std::vector<std::uint8_t>& object, CerealFactory& factory) const override;
    std::vector<std::uint8_t> from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const override;
};

#endif
