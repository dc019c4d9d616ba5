#pragma once

#include <string>
#include <string_view>

#include "domain/Models.hpp"

namespace pulse::storage {

// One newline-free JSON object per candle, keys in declaration order.
std::string serializeCandleLine(const domain::Candle& candle);

std::string serializeManifest(const domain::Manifest& manifest);

// Throws PersistenceError when the text is not a well-formed manifest.
domain::Manifest parseManifest(std::string_view text);

}  // namespace pulse::storage
