#pragma once

#include "buyplan/core/JsonWriter.h"
#include "buyplan/econ/PlanEngine.h"
#include "buyplan/econ/PlanInputs.h"
#include "buyplan/econ/ShipmentQuote.h"
#include "buyplan/pipeline/PipelineState.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace buyplan::io {

// ------------------------------
// Requests (nlohmann::json)

// Reads a request file into `out`. Fails on I/O or JSON syntax errors.
bool loadJsonFile(const std::string& path, nlohmann::json& out, std::string* outError = nullptr);

// {budget, products, suppliers, freightCurves, freightConfig, churnSettings, dims}.
//
// Numbers may arrive as spreadsheet strings ("£1,200", "15%"). Missing fields
// keep their defaults; budget and product checks are left to the engine. Fails
// only when the request or one of its lists has the wrong JSON type.
bool parsePlanRequest(const nlohmann::json& request, econ::PlanInputs& out, std::string* outError = nullptr);

struct QuoteRequest {
  econ::SupplierTerms supplier;
  std::vector<econ::QuoteLine> lines;
};

// Fixed-quantity quote: products carry `unitsToOrder`. The shipping origin
// comes from `shipmentInfo` when present, otherwise from the supplier list
// entry of the first product's supplier. Expects `inputs` already parsed from
// the same request.
bool parseQuoteRequest(const nlohmann::json& request,
                       const econ::PlanInputs& inputs,
                       QuoteRequest& out,
                       std::string* outError = nullptr);

// Reads the JSON written by writePipelineState back into a state that
// runStage accepts as `previous`. Null or missing stage slots stay empty;
// signatures are ignored. Fails on a version mismatch or a wrongly typed slot.
bool parsePipelineState(const nlohmann::json& state,
                        pipeline::PipelineState& out,
                        std::string* outError = nullptr);

// ------------------------------
// Responses (core::JsonWriter)

void writeError(core::JsonWriter& j, const econ::PlanError& e);
void writeAllocation(core::JsonWriter& j, const econ::AllocationResult& a);
void writeShipmentQuote(core::JsonWriter& j, const econ::ShipmentQuote& q);

void writeStageOutput(core::JsonWriter& j, const pipeline::StageOutput& out);

// {meta, inputs, data, stage0..stage8}; empty slots are written as null.
void writePipelineState(core::JsonWriter& j, const pipeline::PipelineState& s, bool withSignatures = false);

// FNV-1a over the compact JSON of one stage slot; empty for an empty slot.
std::string stageSignature(const pipeline::PipelineState& s, int stage);

} // namespace buyplan::io
