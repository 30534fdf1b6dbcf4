#pragma once
#include <string>
#include <cstddef>

#include "cerealizer/core/reflect/cereal_value.h"

// Compact JSON rendering of a CerealValue for log lines and error messages.
// Output only; parsing JSON text is a transport concern and lives elsewhere.
struct CerealJson {
    static std::string dump(const CerealValue& value);

    // dump() cut down to max_length characters, with "..." appended when cut.
    static std::string brief(const CerealValue& value, size_t max_length = 96);
};
