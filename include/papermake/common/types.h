// papermake/common/types.h
#ifndef PAPERMAKE_COMMON_TYPES_H
#define PAPERMAKE_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <chrono>
#include <string>
#include <vector>

namespace papermake {

// nlohmann::json is the data type for render inputs, schemas and stored metadata
using Value = nlohmann::json;

using Bytes = std::vector<std::uint8_t>;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Name under which render input is bound inside a template
inline constexpr const char* kDataInputName = "data";

} // namespace papermake

#endif // PAPERMAKE_COMMON_TYPES_H
