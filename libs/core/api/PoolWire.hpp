/*
RangeScope — PoolWire
Role: JSON wire format of the pool analytics backend, in both directions.
Inputs/Outputs: Typed requests → nlohmann::json bodies; response JSON → typed results.
Threading: Stateless; called from HttpPoolApi on the main thread.
Integration: HttpPoolApi sends the bodies and feeds reply payloads to the parse functions.
Observability: Parse failures throw std::runtime_error; HttpPoolApi turns them into stage errors.
Related: PoolWire.cpp, HttpPoolApi.hpp, PoolTypes.hpp.
Assumptions: Any numeric field may arrive as a number or a numeric string, possibly with ',' decimals.
*/
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "pool/PoolTypes.hpp"
#include "pool/VolumeHistory.hpp"

namespace PoolWire {

// =============================================================================
// Tolerant field access
// =============================================================================

/// Number or numeric string; nullopt when missing, null, malformed or non-finite
std::optional<double> toNumber(const nlohmann::json& value);
std::optional<double> numberField(const nlohmann::json& obj, const char* key);
// Rounded; nullopt outside the int32 range
std::optional<int> intField(const nlohmann::json& obj, const char* key);
std::string stringField(const nlohmann::json& obj, const char* key);

// =============================================================================
// Request bodies
// =============================================================================

nlohmann::json distributionBody(const DistributionRequest& req);
nlohmann::json allocationBody(const AllocationRequest& req);
nlohmann::json aprSimulationBody(const AprSimulationRequest& req);
nlohmann::json matchTicksBody(const MatchTicksRequest& req);

// =============================================================================
// Responses (throw std::runtime_error on a malformed payload)
// =============================================================================

PoolMetadata parsePoolMetadata(const nlohmann::json& j);
PriceSeries parsePriceSeries(const nlohmann::json& j);
DefaultRange parseDefaultRange(const nlohmann::json& j);
LiquidityDistribution parseLiquidityDistribution(const nlohmann::json& j);
AllocationResult parseAllocation(const nlohmann::json& j);
AprSimulationResult parseAprSimulation(const nlohmann::json& j);
VolumeHistory parseVolumeHistory(const nlohmann::json& j);
MatchedRange parseMatchedRange(const nlohmann::json& j);

/**
 * User-facing message for a failed call: the JSON "message" field, else the
 * raw body when it is not JSON, else "Unable to reach <url>".
 */
std::string errorMessage(std::string_view body, std::string_view url);

} // namespace PoolWire
